#pragma once

#include "store.metadata.hh"
#include "volzarr.hh"

#include <filesystem>

namespace volzarr {
/**
 * @brief Reads a Zarr v3 array written with one chunk per slice.
 */
class ChunkedStoreReader
{
  public:
    /**
     * @brief Open the store at @p store_path and parse its metadata.
     * @throw ReadError if the store is missing or its metadata is invalid.
     */
    explicit ChunkedStoreReader(const std::filesystem::path& store_path);

    const ArrayMetadata& metadata() const { return metadata_; }

    /**
     * @brief Decode every chunk and assemble the full volume.
     * @details The returned volume is in native byte order, whatever order
     * the store was written in. Chunks absent from the store decode to the
     * fill value.
     * @throw ReadError if a chunk cannot be read or decoded.
     */
    Volume read() const;

  private:
    std::filesystem::path store_path_;
    ArrayMetadata metadata_;

    void read_chunk_(size_t index, std::span<std::byte> out) const;
};
} // namespace volzarr
