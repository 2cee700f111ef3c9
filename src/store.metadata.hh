#pragma once

#include "blosc.compression.params.hh"
#include "volzarr.hh"

#include <nlohmann/json.hpp>

#include <optional>
#include <vector>

namespace volzarr {
/**
 * @brief Contents of a chunked store's zarr.json.
 */
struct ArrayMetadata
{
    std::vector<size_t> shape;       /* depth, height, width */
    std::vector<size_t> chunk_shape; /* always 1, height, width when written */
    VolzarrDataType dtype{ VolzarrDataType_uint8 };
    VolzarrByteOrder endian{ VolzarrByteOrder_Little };
    std::optional<BloscCompressionParams> compression_params;
    nlohmann::json attributes = nlohmann::json::object();

    /**
     * @brief Serialize as a Zarr v3 array node.
     */
    nlohmann::json to_json() const;

    /**
     * @brief Parse a Zarr v3 array node.
     * @throw ReadError if @p meta is not an array node this library can
     * decode.
     */
    static ArrayMetadata from_json(const nlohmann::json& meta);
};

/**
 * @brief Geometry as stored in the array's attributes.
 */
nlohmann::json
geometry_to_attributes(const Geometry& geometry);
} // namespace volzarr
