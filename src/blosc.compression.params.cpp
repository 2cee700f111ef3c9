#include "blosc.compression.params.hh"
#include "macros.hh"

#include <stdexcept>

volzarr::BloscCompressionParams::BloscCompressionParams(
  std::string_view codec_id,
  uint8_t clevel,
  uint8_t shuffle)
  : codec_id{ codec_id }
  , clevel{ clevel }
  , shuffle{ shuffle }
{
}

std::string
volzarr::shuffle_to_string(uint8_t shuffle)
{
    switch (shuffle) {
        case BLOSC_NOSHUFFLE:
            return "noshuffle";
        case BLOSC_SHUFFLE:
            return "shuffle";
        case BLOSC_BITSHUFFLE:
            return "bitshuffle";
        default:
            throw std::invalid_argument("Invalid shuffle: " +
                                        std::to_string(shuffle));
    }
}

uint8_t
volzarr::shuffle_from_string(std::string_view name)
{
    if (name == "noshuffle") {
        return BLOSC_NOSHUFFLE;
    }
    if (name == "shuffle") {
        return BLOSC_SHUFFLE;
    }
    if (name == "bitshuffle") {
        return BLOSC_BITSHUFFLE;
    }

    throw std::invalid_argument("Unrecognized shuffle: " + std::string(name));
}

bool
volzarr::validate_compression_params(const BloscCompressionParams& params)
{
    int compcode = blosc_compname_to_compcode(params.codec_id.c_str());
    if (compcode < 0) {
        LOG_ERROR("Invalid compression codec: ", params.codec_id);
        return false;
    }

    if (params.clevel > 9) {
        LOG_ERROR("Invalid compression level: ",
                  static_cast<int>(params.clevel),
                  ". Must be between 0 and 9");
        return false;
    }

    if (params.shuffle != BLOSC_NOSHUFFLE && params.shuffle != BLOSC_SHUFFLE &&
        params.shuffle != BLOSC_BITSHUFFLE) {
        LOG_ERROR("Invalid shuffle: ",
                  static_cast<int>(params.shuffle),
                  ". Must be ",
                  BLOSC_NOSHUFFLE,
                  " (no shuffle), ",
                  BLOSC_SHUFFLE,
                  " (byte  shuffle), or ",
                  BLOSC_BITSHUFFLE,
                  " (bit shuffle)");
        return false;
    }

    return true;
}
