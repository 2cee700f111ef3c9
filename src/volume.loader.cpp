#include "volume.loader.hh"
#include "macros.hh"
#include "volzarr.common.hh"

namespace fs = std::filesystem;

volzarr::VolumeLoader::VolumeLoader(std::shared_ptr<SeriesSource> source)
  : source_{ source }
{
    EXPECT(source_, "Series source must not be null.");
}

volzarr::LoadedSeries
volzarr::VolumeLoader::load(const fs::path& series_dir)
{
    auto files = source_->list_series_files(series_dir);
    EXPECT_OR_THROW(DiscoveryError,
                    !files.empty(),
                    "No series files found in ",
                    series_dir);

    LOG_DEBUG("Reading ", files.size(), " files from ", series_dir);

    SeriesImage image;
    try {
        image = source_->read_series(files);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& exc) {
        const std::string err =
          LOG_ERROR("Failed to read series in ", series_dir, ": ", exc.what());
        throw ReadError(err);
    }

    auto& volume = image.volume;
    const auto depth = volume.depth();

    EXPECT_OR_THROW(ReadError,
                    depth > 0 && volume.height() > 0 && volume.width() > 0,
                    "Series in ",
                    series_dir,
                    " has an empty volume");
    EXPECT_OR_THROW(ReadError,
                    volume.data.size() == volume.bytes_of_volume(),
                    "Series in ",
                    series_dir,
                    " returned ",
                    volume.data.size(),
                    " bytes for a volume of ",
                    volume.bytes_of_volume());
    EXPECT_OR_THROW(ReadError,
                    files.size() == depth,
                    "Series in ",
                    series_dir,
                    " has ",
                    files.size(),
                    " files but ",
                    depth,
                    " slices");
    EXPECT_OR_THROW(ReadError,
                    image.slice_tags.size() == depth,
                    "Series in ",
                    series_dir,
                    " has ",
                    image.slice_tags.size(),
                    " tag maps but ",
                    depth,
                    " slices");

    LoadedSeries series;
    series.metadata.filenames = std::move(files);
    series.metadata.slices_metadata = std::move(image.slice_tags);

    auto& geometry = series.metadata.geometry;
    geometry = image.geometry;
    geometry.size = { volume.width(), volume.height(), volume.depth() };
    geometry.pixel_id = pixel_id_of(volume.dtype);
    geometry.pixel_id_type_as_string = pixel_id_type_as_string(volume.dtype);

    series.volume = std::move(volume);

    return series;
}
