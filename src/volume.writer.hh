#pragma once

#include "volzarr.hh"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace volzarr {
/**
 * @brief Name of the file slice @p index is written to.
 * @details The basename of the recorded filename when there is one,
 * otherwise the zero-padded index followed by the extension of the first
 * recorded filename, or @p default_extension if nothing was recorded.
 */
std::string
slice_file_name(size_t index,
                const std::vector<std::string>& filenames,
                std::string_view default_extension);

/**
 * @brief Rebuilds a slice directory from a volume and its metadata record.
 */
class VolumeWriter
{
  public:
    explicit VolumeWriter(std::shared_ptr<SliceWriter> writer);

    /**
     * @brief Write every plane of @p volume as a slice file in @p output_dir.
     * @details @p output_dir is removed and recreated first. Geometry comes
     * from @p record; the element type comes from @p volume. Tags are
     * attached one at a time and a failing tag is recorded and skipped. A
     * failing slice is recorded and the remaining slices are still written.
     * @return One outcome per slice, in index order.
     * @throw WriteError if the output directory cannot be prepared.
     */
    ReconstructionResult write(const Volume& volume,
                               const MetadataRecord& record,
                               const std::filesystem::path& output_dir);

  private:
    std::shared_ptr<SliceWriter> writer_;

    Slice make_slice_(const Volume& volume,
                      const Geometry& geometry,
                      size_t index) const;
    void attach_tags_(Slice& slice,
                      const TagMap& tags,
                      std::vector<TagOutcome>& outcomes);
};
} // namespace volzarr
