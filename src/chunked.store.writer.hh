#pragma once

#include "blosc.compression.params.hh"
#include "store.metadata.hh"
#include "thread.pool.hh"
#include "volzarr.hh"

#include <filesystem>
#include <memory>

namespace volzarr {
struct ChunkedStoreConfig
{
    BloscCompressionParams compression_params;
    VolzarrByteOrder endian; /* byte order recorded in, and used by, the store */

    ChunkedStoreConfig();
};

/**
 * @brief Writes a volume as a Zarr v3 array with one chunk per slice.
 */
class ChunkedStoreWriter
{
  public:
    ChunkedStoreWriter(const ChunkedStoreConfig& config,
                       std::shared_ptr<ThreadPool> thread_pool);

    /**
     * @brief Replace whatever is at @p store_path with a store holding
     * @p volume.
     * @details The existing store, if any, is removed in full before the new
     * one is created. Chunks are compressed on the thread pool; this call
     * returns once every chunk and the array metadata are on disk.
     * @param volume The volume to store. Any byte order is accepted.
     * @param geometry Recorded in the array attributes.
     * @param store_path Directory to hold the store.
     * @return The metadata written to the store.
     * @throw WriteError if the volume is degenerate or anything fails to
     * write.
     */
    ArrayMetadata write(const Volume& volume,
                        const Geometry& geometry,
                        const std::filesystem::path& store_path);

  private:
    ChunkedStoreConfig config_;
    std::shared_ptr<ThreadPool> thread_pool_;

    void write_chunks_(const Volume& volume,
                       const std::filesystem::path& store_path);
    void write_array_metadata_(const ArrayMetadata& metadata,
                               const std::filesystem::path& store_path);
};
} // namespace volzarr
