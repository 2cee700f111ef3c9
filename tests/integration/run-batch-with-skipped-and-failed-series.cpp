#include "series.converter.hh"
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
        volzarr::ConverterSettings settings;
        settings.raw_dir = base_dir / "raw";
        settings.converted_dir = base_dir / "converted";
        settings.reconstructed_dir = base_dir / "reconstructed";

        auto source = std::make_shared<volzarr::test::FakeSeriesSource>();

        // c-good: a healthy series
        fs::create_directories(settings.raw_dir / "c-good");
        source->add_series(settings.raw_dir / "c-good", 3);

        // a-empty: a folder without any series files
        fs::create_directories(settings.raw_dir / "a-empty");

        // b-broken: files that cannot be read
        fs::create_directories(settings.raw_dir / "b-broken");
        source->add_series(settings.raw_dir / "b-broken", 2);
        source->fail_reading(settings.raw_dir / "b-broken");

        // d-partial: one slice cannot be written back
        fs::create_directories(settings.raw_dir / "d-partial");
        volzarr::SeriesImage image;
        image.volume = volzarr::test::make_volume<uint8_t>(
          3, 2, 2, VolzarrDataType_uint8);
        image.slice_tags = { {}, {}, {} };
        const auto partial_dir = settings.raw_dir / "d-partial";
        source->add_series(partial_dir,
                           { (partial_dir / "p0.dcm").string(),
                             (partial_dir / "p1.dcm").string(),
                             (partial_dir / "p2.dcm").string() },
                           image);

        // loose files in the raw directory are not series
        std::ofstream(settings.raw_dir / "README.txt") << "not a series";

        auto slice_writer = std::make_shared<volzarr::test::RawSliceWriter>();
        slice_writer->failing_indices = { 5 };
        volzarr::SeriesConverter converter(settings, source, slice_writer);

        const auto results = converter.run();
        EXPECT_EQ(size_t, results.size(), 4);

        // results come back in name order
        EXPECT_STR_EQ(results[0].series_id, "a-empty");
        EXPECT_EQ(int, results[0].status, VolzarrSeriesStatus_Skipped);
        CHECK(!results[0].reason.empty());
        CHECK(!fs::exists(converter.store_path("a-empty")));

        EXPECT_STR_EQ(results[1].series_id, "b-broken");
        EXPECT_EQ(int, results[1].status, VolzarrSeriesStatus_Failed);
        CHECK(!results[1].reason.empty());
        CHECK(!fs::exists(converter.store_path("b-broken")));

        // a failure does not stop the batch
        EXPECT_STR_EQ(results[2].series_id, "c-good");
        EXPECT_EQ(int, results[2].status, VolzarrSeriesStatus_Ok);
        EXPECT_EQ(size_t, results[2].reconstruction.slices_written(), 3);
        CHECK(fs::is_directory(converter.store_path("c-good")));
        CHECK(fs::is_regular_file(converter.sidecar_path("c-good")));

        EXPECT_STR_EQ(results[3].series_id, "d-partial");
        EXPECT_EQ(int, results[3].status, VolzarrSeriesStatus_Ok);
        EXPECT_EQ(size_t, results[3].reconstruction.slices_written(), 3);

        // a slice failure is reported per slice, the series still succeeds
        slice_writer->failing_indices = { 1 };
        const auto again = converter.process(partial_dir);
        EXPECT_EQ(int, again.status, VolzarrSeriesStatus_Ok);
        EXPECT_EQ(size_t, again.reconstruction.slices_written(), 2);
        EXPECT_EQ(size_t, again.reconstruction.slices_failed(), 1);
        CHECK(!again.reconstruction.slices[1].written);
        CHECK(!fs::exists(converter.reconstruction_path("d-partial") /
                          "p1.dcm"));
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
