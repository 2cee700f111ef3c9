#pragma once

#include "blosc.compression.params.hh"
#include "volzarr.types.h"

#include <filesystem>
#include <string>

namespace volzarr {
struct ConverterSettings
{
    std::filesystem::path raw_dir{ "data/raw" }; /* one subdirectory per series */
    std::filesystem::path converted_dir{ "data/converted" }; /* stores, sidecars */
    std::filesystem::path reconstructed_dir{ "data/reconstructed" };

    std::string store_extension{ ".zarr" };
    std::string sidecar_extension{ ".json" };

    BloscCompressionParams compression_params; /* zstd, level 1, bit shuffle */
    VolzarrByteOrder endian;                   /* defaults to native */
    unsigned int n_threads{ 1 };               /* chunk compression workers */

    VolzarrLogLevel log_level{ VolzarrLogLevel_Info };

    ConverterSettings();

    /**
     * @brief Load settings from a JSON file. Keys that are absent keep their
     * defaults.
     * @throw IOError if the file cannot be read.
     * @throw SettingsError if it is not valid JSON or holds invalid values.
     */
    static ConverterSettings from_json_file(const std::filesystem::path& path);

    /**
     * @brief Check every field, logging the first problem found.
     */
    [[nodiscard]] bool validate() const;
};
} // namespace volzarr
