#include "blosc.compressor.hh"
#include "macros.hh"

std::vector<std::byte>
volzarr::blosc_compress(const BloscCompressionParams& params,
                        size_t bytes_per_element,
                        std::span<const std::byte> src)
{
    const auto tmp_size = src.size() + BLOSC_MAX_OVERHEAD;
    std::vector<std::byte> tmp(tmp_size);

    const auto nb = blosc_compress_ctx(params.clevel,
                                       params.shuffle,
                                       bytes_per_element,
                                       src.size(),
                                       src.data(),
                                       tmp.data(),
                                       tmp_size,
                                       params.codec_id.c_str(),
                                       0 /* blocksize - 0:automatic */,
                                       1);
    EXPECT_OR_THROW(WriteError,
                    nb > 0,
                    "Blosc compression failed with code ",
                    nb,
                    " (codec '",
                    params.codec_id,
                    "')");

    tmp.resize(static_cast<size_t>(nb));
    return tmp;
}

void
volzarr::blosc_decompress(std::span<const std::byte> src,
                          std::span<std::byte> dst)
{
    EXPECT_OR_THROW(ReadError,
                    src.size() >= BLOSC_MIN_HEADER_LENGTH,
                    "Blosc frame of ",
                    src.size(),
                    " bytes is shorter than the Blosc header");

    size_t nbytes = 0, cbytes = 0, blocksize = 0;
    blosc_cbuffer_sizes(src.data(), &nbytes, &cbytes, &blocksize);

    EXPECT_OR_THROW(ReadError,
                    cbytes == src.size(),
                    "Blosc frame declares ",
                    cbytes,
                    " compressed bytes, but ",
                    src.size(),
                    " were read");
    EXPECT_OR_THROW(ReadError,
                    nbytes == dst.size(),
                    "Blosc frame decompresses to ",
                    nbytes,
                    " bytes, expected ",
                    dst.size());

    const auto nb =
      blosc_decompress_ctx(src.data(), dst.data(), dst.size(), 1);
    EXPECT_OR_THROW(ReadError,
                    nb >= 0 && static_cast<size_t>(nb) == dst.size(),
                    "Blosc decompression failed with code ",
                    nb);
}
