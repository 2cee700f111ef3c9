#pragma once

#include "blosc.compression.params.hh"

#include <cstddef>
#include <span>
#include <vector>

namespace volzarr {
/**
 * @brief Compress @p src with Blosc.
 * @param params Codec, level and shuffle to use.
 * @param bytes_per_element Element width, used by the shuffle filter.
 * @param src Uncompressed bytes.
 * @return The Blosc frame.
 * @throw WriteError if Blosc fails.
 */
std::vector<std::byte>
blosc_compress(const BloscCompressionParams& params,
               size_t bytes_per_element,
               std::span<const std::byte> src);

/**
 * @brief Decompress the Blosc frame @p src into @p dst, which must be exactly
 * as large as the uncompressed data.
 * @throw ReadError if the frame is malformed or its size disagrees with
 * @p dst.
 */
void
blosc_decompress(std::span<const std::byte> src, std::span<std::byte> dst);
} // namespace volzarr
