#pragma once

#include <blosc.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace volzarr {
struct BloscCompressionParams
{
    static constexpr char id[] = "blosc";
    std::string codec_id{ "zstd" };
    uint8_t clevel{ 1 };
    uint8_t shuffle{ BLOSC_BITSHUFFLE };

    BloscCompressionParams() = default;
    BloscCompressionParams(std::string_view codec_id,
                           uint8_t clevel,
                           uint8_t shuffle);
};

/**
 * @brief Zarr v3 name of a Blosc shuffle mode: "noshuffle", "shuffle" or
 * "bitshuffle".
 * @throw std::invalid_argument if @p shuffle is not a Blosc shuffle mode.
 */
std::string
shuffle_to_string(uint8_t shuffle);

/**
 * @brief Inverse of shuffle_to_string.
 * @throw std::invalid_argument if @p name is not recognized.
 */
uint8_t
shuffle_from_string(std::string_view name);

/**
 * @brief Check that the codec is one Blosc was built with, the level is in
 * [0, 9] and the shuffle is a known mode. Logs the first problem found.
 */
[[nodiscard]]
bool
validate_compression_params(const BloscCompressionParams& params);
} // namespace volzarr
