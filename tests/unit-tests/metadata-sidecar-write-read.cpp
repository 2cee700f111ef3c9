#include "metadata.sidecar.hh"
#include "test.fakes.hh"
#include "unit.test.macros.hh"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

int
main()
{
    int retval = 0;
    const fs::path base_dir = fs::temp_directory_path() / TEST;

    try {
        EXPECT_STR_EQ(
          volzarr::sidecar_path_for(base_dir / "series01.zarr").string(),
          (base_dir / "series01.json").string());
        EXPECT_STR_EQ(
          volzarr::sidecar_path_for(base_dir / "series01.zarr/", ".meta")
            .string(),
          (base_dir / "series01.meta").string());

        volzarr::MetadataRecord record;
        record.filenames = { "/data/raw/s1/IM0.dcm", "/data/raw/s1/IM1.dcm" };
        record.geometry.origin = { -120.5, 80.25, 14.0 };
        record.geometry.spacing = { 0.75, 0.75, 5.0 };
        record.geometry.direction = { 1, 0, 0, 0, 0, 1, 0, -1, 0 };
        record.geometry.size = { 512, 512, 2 };
        record.geometry.pixel_id = 2;
        record.geometry.pixel_id_type_as_string = "16-bit signed integer";
        record.slices_metadata = { volzarr::test::make_slice_tags(0),
                                   volzarr::test::make_slice_tags(1) };
        record.slices_metadata[1]["0010|0010"] = "Doe^Jane";

        const auto path = base_dir / "nested" / "series01.json";
        volzarr::write_sidecar(record, path);
        CHECK(fs::is_regular_file(path));

        // the document is plain JSON with the expected keys
        {
            std::ifstream file(path);
            const auto doc = nlohmann::json::parse(file);
            for (const auto* key : { "filenames",
                                     "origin",
                                     "spacing",
                                     "direction",
                                     "size",
                                     "pixel_id",
                                     "pixel_id_type_as_string",
                                     "slices_metadata" }) {
                EXPECT(doc.contains(key), "Sidecar is missing '", key, "'");
            }
            EXPECT_STR_EQ(doc["slices_metadata"][1]["0010|0010"]
                            .get<std::string>(),
                          "Doe^Jane");
        }

        const auto read = volzarr::read_sidecar(path);
        CHECK(read.filenames == record.filenames);
        CHECK(read.geometry.origin == record.geometry.origin);
        CHECK(read.geometry.spacing == record.geometry.spacing);
        CHECK(read.geometry.direction == record.geometry.direction);
        CHECK(read.geometry.size == record.geometry.size);
        EXPECT_EQ(int, read.geometry.pixel_id, 2);
        EXPECT_STR_EQ(read.geometry.pixel_id_type_as_string,
                      "16-bit signed integer");
        CHECK(read.slices_metadata == record.slices_metadata);

        // writing again replaces the file
        record.filenames.clear();
        volzarr::write_sidecar(record, path);
        CHECK(volzarr::read_sidecar(path).filenames.empty());
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
