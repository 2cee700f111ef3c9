#include "metadata.sidecar.hh"
#include "macros.hh"
#include "sink.creator.hh"
#include "volzarr.common.hh"

#include <fstream>
#include <limits>
#include <type_traits>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
template<size_t N, typename T>
void
parse_fixed_list(const json& doc, const char* key, std::array<T, N>& out)
{
    if (!doc.contains(key)) {
        return;
    }

    const auto& value = doc[key];
    EXPECT_OR_THROW(volzarr::ParseError,
                    value.is_array() && value.size() == N,
                    "Expected '",
                    key,
                    "' to be a list of ",
                    N,
                    " numbers, got ",
                    value.dump());

    for (size_t i = 0; i < N; ++i) {
        if constexpr (std::is_integral_v<T>) {
            uint64_t element = 0;
            EXPECT_OR_THROW(volzarr::ParseError,
                            volzarr::unsigned_from_json(
                              value[i], std::numeric_limits<T>::max(), element),
                            "Expected a non-negative integer in '",
                            key,
                            "', got ",
                            value[i].dump());
            out[i] = static_cast<T>(element);
        } else {
            EXPECT_OR_THROW(volzarr::ParseError,
                            value[i].is_number(),
                            "Non-numeric entry in '",
                            key,
                            "': ",
                            value[i].dump());
            out[i] = value[i].get<T>();
        }
    }
}

// tag values are strings at the boundary; anything else is stringified
std::string
tag_value_to_string(const json& value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    }

    EXPECT_OR_THROW(volzarr::ParseError,
                    value.is_primitive() && !value.is_null(),
                    "Tag values must be scalars, got ",
                    value.dump());
    return value.dump();
}
} // namespace

fs::path
volzarr::sidecar_path_for(const fs::path& store_path,
                          std::string_view extension)
{
    auto path = store_path;
    if (!path.has_filename()) {
        path = path.parent_path();
    }
    return path.replace_extension(extension);
}

json
volzarr::metadata_record_to_json(const MetadataRecord& record)
{
    const auto& geometry = record.geometry;

    json slices_metadata = json::array();
    for (const auto& tags : record.slices_metadata) {
        slices_metadata.push_back(tags);
    }

    json doc;
    doc["filenames"] = record.filenames;
    doc["origin"] = geometry.origin;
    doc["spacing"] = geometry.spacing;
    doc["direction"] = geometry.direction;
    doc["size"] = geometry.size;
    doc["pixel_id"] = geometry.pixel_id;
    doc["pixel_id_type_as_string"] = geometry.pixel_id_type_as_string;
    doc["slices_metadata"] = slices_metadata;

    return doc;
}

volzarr::MetadataRecord
volzarr::metadata_record_from_json(const json& doc)
{
    EXPECT_OR_THROW(ParseError,
                    doc.is_object(),
                    "Sidecar must be a JSON object, got ",
                    doc.type_name());

    MetadataRecord record;
    auto& geometry = record.geometry;

    if (doc.contains("filenames")) {
        const auto& filenames = doc["filenames"];
        EXPECT_OR_THROW(ParseError,
                        filenames.is_array(),
                        "Expected 'filenames' to be a list");
        for (const auto& name : filenames) {
            EXPECT_OR_THROW(ParseError,
                            name.is_string(),
                            "Non-string filename: ",
                            name.dump());
            record.filenames.push_back(name.get<std::string>());
        }
    }

    parse_fixed_list(doc, "origin", geometry.origin);
    parse_fixed_list(doc, "spacing", geometry.spacing);
    parse_fixed_list(doc, "direction", geometry.direction);
    parse_fixed_list(doc, "size", geometry.size);

    if (doc.contains("pixel_id")) {
        EXPECT_OR_THROW(ParseError,
                        doc["pixel_id"].is_number_integer(),
                        "Expected 'pixel_id' to be an integer, got ",
                        doc["pixel_id"].dump());
        geometry.pixel_id = doc["pixel_id"].get<int>();
    }

    if (doc.contains("pixel_id_type_as_string")) {
        EXPECT_OR_THROW(ParseError,
                        doc["pixel_id_type_as_string"].is_string(),
                        "Expected 'pixel_id_type_as_string' to be a string");
        geometry.pixel_id_type_as_string =
          doc["pixel_id_type_as_string"].get<std::string>();
    }

    if (doc.contains("slices_metadata")) {
        const auto& slices = doc["slices_metadata"];
        EXPECT_OR_THROW(ParseError,
                        slices.is_array(),
                        "Expected 'slices_metadata' to be a list");

        for (const auto& slice : slices) {
            EXPECT_OR_THROW(ParseError,
                            slice.is_object(),
                            "Expected each slice's metadata to be an object, "
                            "got ",
                            slice.dump());

            TagMap tags;
            for (const auto& [key, value] : slice.items()) {
                tags.emplace(key, tag_value_to_string(value));
            }
            record.slices_metadata.push_back(std::move(tags));
        }
    }

    return record;
}

void
volzarr::write_sidecar(const MetadataRecord& record, const fs::path& path)
{
    const std::string doc = metadata_record_to_json(record).dump(4);

    auto sink = SinkCreator::make_sink(path.string());
    EXPECT_OR_THROW(
      IOError, sink != nullptr, "Failed to create sidecar ", path);

    const std::span data = { reinterpret_cast<const std::byte*>(doc.data()),
                             doc.size() };
    EXPECT_OR_THROW(
      IOError, sink->write(0, data), "Failed to write sidecar ", path);
    EXPECT_OR_THROW(IOError,
                    sink->close(),
                    "Failed to finalize sidecar ",
                    path);
}

volzarr::MetadataRecord
volzarr::read_sidecar(const fs::path& path)
{
    EXPECT_OR_THROW(IOError,
                    fs::is_regular_file(path),
                    "Sidecar ",
                    path,
                    " does not exist or is not a file");

    std::ifstream file(path);
    EXPECT_OR_THROW(IOError, file.is_open(), "Failed to open sidecar ", path);

    const auto doc = json::parse(file,
                                 nullptr, // callback
                                 false,   // allow exceptions
                                 true     // ignore comments
    );
    EXPECT_OR_THROW(
      ParseError, !doc.is_discarded(), "Invalid JSON in sidecar ", path);

    return metadata_record_from_json(doc);
}
