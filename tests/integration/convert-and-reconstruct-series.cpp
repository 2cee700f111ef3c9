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
        settings.n_threads = 3;

        const auto series_dir = settings.raw_dir / "series01";
        fs::create_directories(series_dir);

        auto source = std::make_shared<volzarr::test::FakeSeriesSource>();
        source->add_series(series_dir, 8);
        const auto original =
          source->read_series(source->list_series_files(series_dir));

        auto slice_writer = std::make_shared<volzarr::test::RawSliceWriter>();
        volzarr::SeriesConverter converter(settings, source, slice_writer);

        const auto result = converter.process(series_dir);
        EXPECT_EQ(int, result.status, VolzarrSeriesStatus_Ok);
        EXPECT_STR_EQ(result.series_id, "series01");
        CHECK(result.reason.empty());
        CHECK(result.store_path == settings.converted_dir / "series01.zarr");
        CHECK(result.sidecar_path == settings.converted_dir / "series01.json");

        // store
        volzarr::ChunkedStoreReader reader(result.store_path);
        const auto& metadata = reader.metadata();
        CHECK(metadata.shape == std::vector<size_t>({ 8, 4, 5 }));
        CHECK(metadata.chunk_shape == std::vector<size_t>({ 1, 4, 5 }));
        EXPECT_EQ(int, metadata.dtype, VolzarrDataType_int16);
        CHECK(metadata.compression_params.has_value());
        EXPECT_STR_EQ(metadata.compression_params->codec_id, "zstd");
        CHECK(reader.read().data == original.volume.data);

        // sidecar
        const auto record = volzarr::read_sidecar(result.sidecar_path);
        EXPECT_EQ(size_t, record.filenames.size(), 8);
        CHECK((record.geometry.size == std::array<uint64_t, 3>({ 5, 4, 8 })));
        EXPECT_EQ(int, record.geometry.pixel_id, 2);
        CHECK(record.geometry.spacing == original.geometry.spacing);
        CHECK(record.slices_metadata == original.slice_tags);

        // reconstruction
        const auto& reconstruction = result.reconstruction;
        CHECK(reconstruction.output_dir ==
              settings.reconstructed_dir / "series01");
        EXPECT_EQ(size_t, reconstruction.slices_written(), 8);
        EXPECT_EQ(size_t, reconstruction.slices_failed(), 0);

        const auto names =
          volzarr::test::list_file_names(reconstruction.output_dir);
        EXPECT_EQ(size_t, names.size(), 8);
        for (size_t i = 0; i < 8; ++i) {
            const auto name = "IM" + std::to_string(i) + ".dcm";
            const auto& slice = slice_writer->written.at(name);
            const auto plane = original.volume.plane(i);
            CHECK(std::equal(
              slice.data.begin(), slice.data.end(), plane.begin(), plane.end()));
            CHECK(slice.tags == original.slice_tags[i]);
            EXPECT_EQ(double, slice.origin[2], 30.0 + 2.5 * i);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
