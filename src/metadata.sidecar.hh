#pragma once

#include "volzarr.hh"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>

namespace volzarr {
/**
 * @brief Path of the sidecar paired with @p store_path: same directory and
 * base name, with @p extension in place of the store's extension.
 */
std::filesystem::path
sidecar_path_for(const std::filesystem::path& store_path,
                 std::string_view extension = ".json");

nlohmann::json
metadata_record_to_json(const MetadataRecord& record);

/**
 * @brief Parse a sidecar document. Missing fields keep their defaults.
 * @throw ParseError if a field is present but has the wrong shape.
 */
MetadataRecord
metadata_record_from_json(const nlohmann::json& doc);

/**
 * @brief Write @p record to @p path, replacing any existing file.
 * @throw IOError if the file cannot be written.
 */
void
write_sidecar(const MetadataRecord& record, const std::filesystem::path& path);

/**
 * @brief Read the sidecar at @p path.
 * @throw IOError if the file cannot be read.
 * @throw ParseError if it is not a valid sidecar document.
 */
MetadataRecord
read_sidecar(const std::filesystem::path& path);
} // namespace volzarr
