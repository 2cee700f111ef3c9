#include "chunked.store.reader.hh"
#include "metadata.sidecar.hh"
#include "series.converter.hh"
#include "test.fakes.hh"
#include "unit.test.macros.hh"

#include <filesystem>

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
        settings.endian = volzarr::native_byte_order() == VolzarrByteOrder_Big
                            ? VolzarrByteOrder_Little
                            : VolzarrByteOrder_Big;

        const auto series_dir = settings.raw_dir / "series01";
        fs::create_directories(series_dir);

        auto slice_writer = std::make_shared<volzarr::test::RawSliceWriter>();

        // first pass: six slices
        {
            auto source = std::make_shared<volzarr::test::FakeSeriesSource>();
            source->add_series(series_dir, 6);
            volzarr::SeriesConverter converter(settings, source, slice_writer);
            const auto result = converter.process(series_dir);
            EXPECT_EQ(int, result.status, VolzarrSeriesStatus_Ok);
            EXPECT_EQ(size_t, result.reconstruction.slices_written(), 6);
        }

        // second pass: the same series now has two slices
        auto source = std::make_shared<volzarr::test::FakeSeriesSource>();
        source->add_series(series_dir, 2);
        volzarr::SeriesConverter converter(settings, source, slice_writer);
        const auto result = converter.process(series_dir);
        EXPECT_EQ(int, result.status, VolzarrSeriesStatus_Ok);

        // store, sidecar and reconstruction reflect only the second pass
        CHECK(!fs::exists(result.store_path / "c" / "2"));
        volzarr::ChunkedStoreReader reader(result.store_path);
        CHECK(reader.metadata().shape == std::vector<size_t>({ 2, 4, 5 }));
        EXPECT_EQ(int, reader.metadata().endian, settings.endian);

        const auto expected =
          source->read_series(source->list_series_files(series_dir));
        CHECK(reader.read().data == expected.volume.data);

        const auto record = volzarr::read_sidecar(result.sidecar_path);
        EXPECT_EQ(size_t, record.filenames.size(), 2);
        EXPECT_EQ(size_t, record.slices_metadata.size(), 2);

        const std::vector<std::string> expected_names{ "IM0.dcm", "IM1.dcm" };
        CHECK(volzarr::test::list_file_names(
                converter.reconstruction_path("series01")) == expected_names);
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
