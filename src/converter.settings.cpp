#include "converter.settings.hh"
#include "macros.hh"
#include "volzarr.common.hh"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
VolzarrLogLevel
log_level_from_string(std::string_view name)
{
    if (name == "debug") {
        return VolzarrLogLevel_Debug;
    }
    if (name == "info") {
        return VolzarrLogLevel_Info;
    }
    if (name == "warning") {
        return VolzarrLogLevel_Warning;
    }
    if (name == "error") {
        return VolzarrLogLevel_Error;
    }
    if (name == "none") {
        return VolzarrLogLevel_None;
    }

    throw std::invalid_argument("Unrecognized log level: " +
                                std::string(name));
}

[[nodiscard]]
bool
validate_extension(std::string_view extension, std::string_view what)
{
    if (volzarr::is_empty_string(extension,
                                 std::string(what) + " extension is empty")) {
        return false;
    }

    if (!extension.starts_with(".") || extension.size() < 2) {
        LOG_ERROR(what,
                  " extension '",
                  extension,
                  "' must start with '.' and name an extension");
        return false;
    }

    return true;
}
} // namespace

volzarr::ConverterSettings::ConverterSettings()
  : endian{ native_byte_order() }
{
}

volzarr::ConverterSettings
volzarr::ConverterSettings::from_json_file(const fs::path& path)
{
    EXPECT_OR_THROW(IOError,
                    fs::is_regular_file(path),
                    "Settings file ",
                    path,
                    " does not exist or is not a file");

    std::ifstream file(path);
    EXPECT_OR_THROW(IOError, file.is_open(), "Failed to open ", path);

    const auto doc = json::parse(file,
                                 nullptr, // callback
                                 false,   // allow exceptions
                                 true     // ignore comments
    );
    EXPECT_OR_THROW(SettingsError,
                    !doc.is_discarded() && doc.is_object(),
                    "Settings file ",
                    path,
                    " is not a JSON object");

    ConverterSettings settings;
    try {
        if (doc.contains("raw_dir")) {
            settings.raw_dir = doc["raw_dir"].get<std::string>();
        }
        if (doc.contains("converted_dir")) {
            settings.converted_dir = doc["converted_dir"].get<std::string>();
        }
        if (doc.contains("reconstructed_dir")) {
            settings.reconstructed_dir =
              doc["reconstructed_dir"].get<std::string>();
        }
        if (doc.contains("store_extension")) {
            settings.store_extension =
              doc["store_extension"].get<std::string>();
        }
        if (doc.contains("sidecar_extension")) {
            settings.sidecar_extension =
              doc["sidecar_extension"].get<std::string>();
        }
        if (doc.contains("compression")) {
            const auto& compression = doc["compression"];
            auto& params = settings.compression_params;
            if (compression.contains("cname")) {
                params.codec_id = compression["cname"].get<std::string>();
            }
            if (compression.contains("clevel")) {
                uint64_t clevel = 0;
                if (!unsigned_from_json(compression["clevel"], 9, clevel)) {
                    throw std::invalid_argument(
                      "clevel must be an integer in [0, 9], got " +
                      compression["clevel"].dump());
                }
                params.clevel = static_cast<uint8_t>(clevel);
            }
            if (compression.contains("shuffle")) {
                params.shuffle = shuffle_from_string(
                  compression["shuffle"].get<std::string>());
            }
        }
        if (doc.contains("endian")) {
            settings.endian =
              byte_order_from_string(doc["endian"].get<std::string>());
        }
        if (doc.contains("threads")) {
            uint64_t n_threads = 0;
            if (!unsigned_from_json(doc["threads"],
                                    std::numeric_limits<unsigned int>::max(),
                                    n_threads)) {
                throw std::invalid_argument(
                  "threads must be a non-negative integer, got " +
                  doc["threads"].dump());
            }
            settings.n_threads = static_cast<unsigned int>(n_threads);
        }
        if (doc.contains("log_level")) {
            settings.log_level =
              log_level_from_string(doc["log_level"].get<std::string>());
        }
    } catch (const std::exception& exc) {
        const std::string err =
          LOG_ERROR("Invalid settings in ", path, ": ", exc.what());
        throw SettingsError(err);
    }

    EXPECT_OR_THROW(SettingsError,
                    settings.validate(),
                    "Invalid settings in ",
                    path);

    return settings;
}

bool
volzarr::ConverterSettings::validate() const
{
    if (is_empty_string(raw_dir.string(), "Raw directory is empty") ||
        is_empty_string(converted_dir.string(),
                        "Converted directory is empty") ||
        is_empty_string(reconstructed_dir.string(),
                        "Reconstructed directory is empty")) {
        return false;
    }

    if (!validate_extension(store_extension, "Store") ||
        !validate_extension(sidecar_extension, "Sidecar")) {
        return false;
    }

    if (store_extension == sidecar_extension) {
        LOG_ERROR("Store and sidecar extensions must differ, both are '",
                  store_extension,
                  "'");
        return false;
    }

    if (!validate_compression_params(compression_params)) {
        return false;
    }

    if (endian >= VolzarrByteOrderCount) {
        LOG_ERROR("Invalid byte order: ", endian);
        return false;
    }

    if (n_threads == 0) {
        LOG_ERROR("Number of threads must be positive");
        return false;
    }

    if (log_level >= VolzarrLogLevelCount) {
        LOG_ERROR("Invalid log level: ", log_level);
        return false;
    }

    return true;
}
