#include "chunked.store.reader.hh"
#include "blosc.compressor.hh"
#include "macros.hh"
#include "sink.creator.hh"
#include "volzarr.common.hh"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <new>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
std::vector<std::byte>
read_file(const fs::path& path)
{
    std::ifstream file(path, std::ios::binary);
    EXPECT_OR_THROW(
      volzarr::ReadError, file.is_open(), "Failed to open ", path);

    std::vector<char> contents((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    EXPECT_OR_THROW(
      volzarr::ReadError, !file.bad(), "Failed to read ", path);

    std::vector<std::byte> bytes(contents.size());
    std::transform(contents.begin(),
                   contents.end(),
                   bytes.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return bytes;
}
} // namespace

volzarr::ChunkedStoreReader::ChunkedStoreReader(const fs::path& store_path)
  : store_path_{ store_path }
{
    EXPECT_OR_THROW(ReadError,
                    fs::is_directory(store_path_),
                    "Store ",
                    store_path_,
                    " does not exist or is not a directory");

    const auto metadata_path = store_path_ / "zarr.json";
    EXPECT_OR_THROW(ReadError,
                    fs::is_regular_file(metadata_path),
                    "Missing array metadata ",
                    metadata_path);

    std::ifstream file(metadata_path);
    EXPECT_OR_THROW(
      ReadError, file.is_open(), "Failed to open ", metadata_path);

    const auto meta = nlohmann::json::parse(file,
                                            nullptr, // callback
                                            false,   // allow exceptions
                                            true     // ignore comments
    );
    EXPECT_OR_THROW(ReadError,
                    !meta.is_discarded(),
                    "Invalid JSON in ",
                    metadata_path);

    metadata_ = ArrayMetadata::from_json(meta);

    const auto& shape = metadata_.shape;
    const auto& chunks = metadata_.chunk_shape;
    EXPECT_OR_THROW(ReadError,
                    chunks[0] == 1 && chunks[1] == shape[1] &&
                      chunks[2] == shape[2],
                    "Unsupported chunk shape (",
                    chunks[0],
                    ", ",
                    chunks[1],
                    ", ",
                    chunks[2],
                    "); expected one chunk per slice");
}

volzarr::Volume
volzarr::ChunkedStoreReader::read() const
{
    Volume volume;
    volume.shape = { metadata_.shape[0],
                     metadata_.shape[1],
                     metadata_.shape[2] };
    volume.dtype = metadata_.dtype;
    volume.byte_order = native_byte_order();
    try {
        volume.data.resize(volume.bytes_of_volume());
    } catch (const std::bad_alloc& exc) {
        const std::string err = LOG_ERROR("Cannot allocate ",
                                          volume.bytes_of_volume(),
                                          " bytes for ",
                                          store_path_,
                                          ": ",
                                          exc.what());
        throw ReadError(err);
    } catch (const std::length_error& exc) {
        const std::string err = LOG_ERROR(
          "Array in ", store_path_, " is too large: ", exc.what());
        throw ReadError(err);
    }

    const auto bytes_of_chunk = volume.bytes_of_plane();
    for (size_t i = 0; i < volume.depth(); ++i) {
        std::span<std::byte> out(volume.data.data() + i * bytes_of_chunk,
                                 bytes_of_chunk);
        read_chunk_(i, out);
    }

    LOG_DEBUG("Read ", volume.depth(), " chunks from ", store_path_);
    return volume;
}

void
volzarr::ChunkedStoreReader::read_chunk_(size_t index,
                                         std::span<std::byte> out) const
{
    const fs::path path =
      SinkCreator::chunk_path(store_path_.string(), index);

    if (!fs::exists(path)) {
        LOG_DEBUG("Chunk ", path, " is absent; using fill value");
        std::fill(out.begin(), out.end(), std::byte{ 0 });
        return;
    }

    const auto encoded = read_file(path);

    if (metadata_.compression_params) {
        blosc_decompress(encoded, out);
    } else {
        EXPECT_OR_THROW(ReadError,
                        encoded.size() == out.size(),
                        "Chunk ",
                        path,
                        " holds ",
                        encoded.size(),
                        " bytes, expected ",
                        out.size());
        std::copy(encoded.begin(), encoded.end(), out.begin());
    }

    if (metadata_.endian != native_byte_order()) {
        swap_byte_order(out, bytes_of_type(metadata_.dtype));
    }
}
