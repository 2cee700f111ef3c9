#include "store.metadata.hh"
#include "macros.hh"
#include "volzarr.common.hh"

#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace {
const char* const kBytesCodec = "bytes";
const char* const kBloscCodec = "blosc";

// largest array, in bytes, that a reader will allocate
constexpr uint64_t kMaxArrayBytes = 1ull << 40;
constexpr uint64_t kMaxClevel = 9;

std::vector<size_t>
parse_shape(const json& meta, const char* key)
{
    const auto& value = meta.at(key);
    EXPECT_OR_THROW(volzarr::ReadError,
                    value.is_array() && value.size() == 3,
                    "Expected '",
                    key,
                    "' to be a list of 3 sizes, got ",
                    value.dump());

    std::vector<size_t> shape;
    for (const auto& element : value) {
        uint64_t extent = 0;
        EXPECT_OR_THROW(volzarr::ReadError,
                        volzarr::unsigned_from_json(
                          element, std::numeric_limits<size_t>::max(), extent),
                        "Expected '",
                        key,
                        "' to hold non-negative integers, got ",
                        value.dump());
        EXPECT_OR_THROW(volzarr::ReadError,
                        extent > 0,
                        "Zero extent in '",
                        key,
                        "': ",
                        value.dump());
        shape.push_back(static_cast<size_t>(extent));
    }

    return shape;
}

void
check_array_size(const std::vector<size_t>& shape, size_t bytes_per_element)
{
    uint64_t bytes = bytes_per_element;
    for (const auto& extent : shape) {
        EXPECT_OR_THROW(volzarr::ReadError,
                        bytes <= kMaxArrayBytes / extent,
                        "Array of shape [",
                        shape[0],
                        ", ",
                        shape[1],
                        ", ",
                        shape[2],
                        "] exceeds ",
                        kMaxArrayBytes,
                        " bytes");
        bytes *= extent;
    }
}

void
parse_codecs(const json& codecs, volzarr::ArrayMetadata& metadata)
{
    EXPECT_OR_THROW(volzarr::ReadError,
                    codecs.is_array() && !codecs.empty(),
                    "Expected a non-empty codec list, got ",
                    codecs.dump());

    const auto& bytes = codecs.at(0);
    EXPECT_OR_THROW(volzarr::ReadError,
                    bytes.at("name").get<std::string>() == kBytesCodec,
                    "First codec must be '",
                    kBytesCodec,
                    "', got ",
                    bytes.dump());

    // single-byte types may leave the endianness out
    if (bytes.contains("configuration") &&
        bytes["configuration"].contains("endian")) {
        metadata.endian = volzarr::byte_order_from_string(
          bytes["configuration"]["endian"].get<std::string>());
    } else {
        EXPECT_OR_THROW(volzarr::ReadError,
                        volzarr::bytes_of_type(metadata.dtype) == 1,
                        "Missing endianness for multi-byte data type");
        metadata.endian = volzarr::native_byte_order();
    }

    if (codecs.size() == 1) {
        return;
    }

    EXPECT_OR_THROW(volzarr::ReadError,
                    codecs.size() == 2,
                    "Unsupported codec pipeline: ",
                    codecs.dump());

    const auto& blosc = codecs.at(1);
    EXPECT_OR_THROW(volzarr::ReadError,
                    blosc.at("name").get<std::string>() == kBloscCodec,
                    "Unsupported codec: ",
                    blosc.dump());

    const auto& config = blosc.at("configuration");
    uint64_t clevel = 0;
    EXPECT_OR_THROW(volzarr::ReadError,
                    volzarr::unsigned_from_json(
                      config.at("clevel"), kMaxClevel, clevel),
                    "Blosc clevel must be an integer in [0, ",
                    kMaxClevel,
                    "], got ",
                    config.at("clevel").dump());

    volzarr::BloscCompressionParams params(
      config.at("cname").get<std::string>(),
      static_cast<uint8_t>(clevel),
      volzarr::shuffle_from_string(config.at("shuffle").get<std::string>()));
    metadata.compression_params = params;
}
} // namespace

json
volzarr::ArrayMetadata::to_json() const
{
    json codecs = json::array();
    codecs.push_back(json::object({
      { "name", kBytesCodec },
      { "configuration", { { "endian", byte_order_to_string(endian) } } },
    }));

    if (compression_params) {
        const auto& params = *compression_params;
        codecs.push_back(json::object({
          { "name", kBloscCodec },
          { "configuration",
            json::object({
              { "cname", params.codec_id },
              { "clevel", params.clevel },
              { "shuffle", shuffle_to_string(params.shuffle) },
              { "typesize", bytes_of_type(dtype) },
              { "blocksize", 0 },
            }) },
        }));
    }

    json metadata;
    metadata["zarr_format"] = 3;
    metadata["node_type"] = "array";
    metadata["shape"] = shape;
    metadata["data_type"] = data_type_to_string(dtype);
    metadata["chunk_grid"] = json::object({
      { "name", "regular" },
      { "configuration", { { "chunk_shape", chunk_shape } } },
    });
    metadata["chunk_key_encoding"] = json::object({
      { "name", "default" },
      { "configuration", { { "separator", "/" } } },
    });
    metadata["fill_value"] = 0;
    metadata["codecs"] = codecs;
    metadata["dimension_names"] = { "z", "y", "x" };
    metadata["attributes"] = attributes;

    return metadata;
}

volzarr::ArrayMetadata
volzarr::ArrayMetadata::from_json(const json& meta)
{
    ArrayMetadata metadata;

    try {
        EXPECT_OR_THROW(ReadError,
                        meta.is_object(),
                        "Array metadata must be a JSON object");
        EXPECT_OR_THROW(ReadError,
                        meta.at("zarr_format").get<int>() == 3,
                        "Unsupported zarr_format: ",
                        meta.at("zarr_format").dump());
        EXPECT_OR_THROW(ReadError,
                        meta.at("node_type").get<std::string>() == "array",
                        "Store root is not an array node");

        metadata.shape = parse_shape(meta, "shape");
        metadata.dtype =
          data_type_from_string(meta.at("data_type").get<std::string>());
        check_array_size(metadata.shape, bytes_of_type(metadata.dtype));

        const auto& grid = meta.at("chunk_grid");
        EXPECT_OR_THROW(ReadError,
                        grid.at("name").get<std::string>() == "regular",
                        "Unsupported chunk grid: ",
                        grid.dump());
        metadata.chunk_shape =
          parse_shape(grid.at("configuration"), "chunk_shape");

        parse_codecs(meta.at("codecs"), metadata);

        if (meta.contains("attributes")) {
            metadata.attributes = meta["attributes"];
        }
    } catch (const ReadError&) {
        throw;
    } catch (const std::exception& exc) {
        const std::string err =
          LOG_ERROR("Invalid array metadata: ", exc.what());
        throw ReadError(err);
    }

    return metadata;
}

json
volzarr::geometry_to_attributes(const Geometry& geometry)
{
    return json::object({
      { "origin", geometry.origin },
      { "spacing", geometry.spacing },
      { "direction", geometry.direction },
    });
}
