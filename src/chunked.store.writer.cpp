#include "chunked.store.writer.hh"
#include "blosc.compressor.hh"
#include "macros.hh"
#include "sink.creator.hh"
#include "volzarr.common.hh"

#include <string>
#include <vector>

namespace fs = std::filesystem;

volzarr::ChunkedStoreConfig::ChunkedStoreConfig()
  : endian{ native_byte_order() }
{
}

volzarr::ChunkedStoreWriter::ChunkedStoreWriter(
  const ChunkedStoreConfig& config,
  std::shared_ptr<ThreadPool> thread_pool)
  : config_{ config }
  , thread_pool_{ thread_pool }
{
    EXPECT(thread_pool_, "Thread pool must not be null.");
    EXPECT_OR_THROW(SettingsError,
                    validate_compression_params(config_.compression_params),
                    "Invalid compression parameters");
    EXPECT_OR_THROW(SettingsError,
                    config_.endian < VolzarrByteOrderCount,
                    "Invalid byte order: ",
                    config_.endian);
}

volzarr::ArrayMetadata
volzarr::ChunkedStoreWriter::write(const Volume& volume,
                                   const Geometry& geometry,
                                   const fs::path& store_path)
{
    EXPECT_OR_THROW(WriteError,
                    !store_path.empty(),
                    "Store path must not be empty.");
    EXPECT_OR_THROW(WriteError,
                    volume.depth() > 0 && volume.height() > 0 &&
                      volume.width() > 0,
                    "Cannot store a volume with shape (",
                    volume.depth(),
                    ", ",
                    volume.height(),
                    ", ",
                    volume.width(),
                    ")");
    EXPECT_OR_THROW(WriteError,
                    volume.data.size() == volume.bytes_of_volume(),
                    "Volume buffer holds ",
                    volume.data.size(),
                    " bytes, expected ",
                    volume.bytes_of_volume());

    std::error_code ec;
    if (fs::exists(store_path, ec)) {
        LOG_DEBUG("Removing existing store at ", store_path);
        fs::remove_all(store_path, ec);
        EXPECT_OR_THROW(WriteError,
                        !ec,
                        "Failed to remove existing store ",
                        store_path,
                        ": ",
                        ec.message());
    }

    fs::create_directories(store_path, ec);
    EXPECT_OR_THROW(WriteError,
                    !ec && fs::is_directory(store_path),
                    "Failed to create store directory ",
                    store_path,
                    ": ",
                    ec.message());

    ArrayMetadata metadata;
    metadata.shape = { volume.depth(), volume.height(), volume.width() };
    metadata.chunk_shape = { 1, volume.height(), volume.width() };
    metadata.dtype = volume.dtype;
    metadata.endian = config_.endian;
    metadata.compression_params = config_.compression_params;
    metadata.attributes = geometry_to_attributes(geometry);

    write_chunks_(volume, store_path);
    write_array_metadata_(metadata, store_path);

    return metadata;
}

void
volzarr::ChunkedStoreWriter::write_chunks_(const Volume& volume,
                                           const fs::path& store_path)
{
    const auto bytes_per_px = bytes_of_type(volume.dtype);
    const auto n_chunks = volume.depth();
    const auto base_path = store_path.string();
    const bool swap = volume.byte_order != config_.endian;
    const BloscCompressionParams& params = config_.compression_params;

    std::vector<ThreadPool::Job> jobs;
    jobs.reserve(n_chunks);
    for (size_t i = 0; i < n_chunks; ++i) {
        const auto plane = volume.plane(i);
        const auto path = SinkCreator::chunk_path(base_path, i);

        jobs.emplace_back([&params, plane, path, bytes_per_px, swap] {
            std::vector<std::byte> encoded(plane.begin(), plane.end());
            if (swap) {
                swap_byte_order(encoded, bytes_per_px);
            }

            const auto compressed =
              blosc_compress(params, bytes_per_px, encoded);

            auto sink = SinkCreator::make_sink(path);
            EXPECT(sink != nullptr, "Failed to create chunk file ", path);
            EXPECT(sink->write(0, compressed),
                   "Failed to write chunk file ",
                   path);
            EXPECT(sink->close(), "Failed to finalize chunk file ", path);
        });
    }

    const auto outcomes = thread_pool_->run_all(jobs);

    size_t n_failed = 0;
    std::string first_error;
    for (const auto& outcome : outcomes) {
        if (!outcome.empty()) {
            if (n_failed++ == 0) {
                first_error = outcome;
            }
        }
    }

    EXPECT_OR_THROW(WriteError,
                    n_failed == 0,
                    n_failed,
                    " of ",
                    n_chunks,
                    " chunks failed to write to ",
                    store_path,
                    "; first error: ",
                    first_error);

    LOG_DEBUG("Wrote ", n_chunks, " chunks to ", store_path);
}

void
volzarr::ChunkedStoreWriter::write_array_metadata_(
  const ArrayMetadata& metadata,
  const fs::path& store_path)
{
    const auto metadata_path = (store_path / "zarr.json").string();
    const std::string metadata_str = metadata.to_json().dump(4);

    auto sink = SinkCreator::make_sink(metadata_path);
    EXPECT_OR_THROW(WriteError,
                    sink != nullptr,
                    "Failed to create metadata sink: ",
                    metadata_path);

    const std::span data = { reinterpret_cast<const std::byte*>(
                               metadata_str.data()),
                             metadata_str.size() };
    EXPECT_OR_THROW(WriteError,
                    sink->write(0, data),
                    "Failed to write array metadata to ",
                    metadata_path);
    EXPECT_OR_THROW(WriteError,
                    sink->close(),
                    "Failed to finalize array metadata ",
                    metadata_path);
}
