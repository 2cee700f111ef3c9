#pragma once

#include "volzarr.hh"

namespace volzarr {
/**
 * @brief SliceWriter producing single-frame DICOM files through ITK and
 * GDCM. Original UIDs carried in the tags are kept.
 */
class ItkSliceWriter : public SliceWriter
{
  public:
    std::string default_extension() const override;

    /**
     * @throw TagAttachError unless @p key has the DICOM "gggg|eeee" form.
     */
    void attach_tag(Slice& slice,
                    const std::string& key,
                    const std::string& value) override;

    void write(const Slice& slice, const std::filesystem::path& path) override;
};
} // namespace volzarr
