#include "series.converter.hh"
#include "chunked.store.reader.hh"
#include "macros.hh"
#include "metadata.sidecar.hh"

#include <algorithm>

namespace fs = std::filesystem;

namespace {
const volzarr::ConverterSettings&
validated(const volzarr::ConverterSettings& settings)
{
    EXPECT_OR_THROW(volzarr::SettingsError,
                    settings.validate(),
                    "Invalid converter settings");
    return settings;
}

volzarr::ChunkedStoreConfig
make_store_config(const volzarr::ConverterSettings& settings)
{
    volzarr::ChunkedStoreConfig config;
    config.compression_params = settings.compression_params;
    config.endian = settings.endian;
    return config;
}
} // namespace

volzarr::SeriesConverter::SeriesConverter(
  const ConverterSettings& settings,
  std::shared_ptr<SeriesSource> source,
  std::shared_ptr<SliceWriter> writer)
  : settings_{ validated(settings) }
  , thread_pool_{ std::make_shared<ThreadPool>(settings.n_threads) }
  , loader_{ source }
  , store_writer_{ make_store_config(settings), thread_pool_ }
  , volume_writer_{ writer }
{
}

fs::path
volzarr::SeriesConverter::store_path(const std::string& series_id) const
{
    return settings_.converted_dir / (series_id + settings_.store_extension);
}

fs::path
volzarr::SeriesConverter::sidecar_path(const std::string& series_id) const
{
    return sidecar_path_for(store_path(series_id),
                            settings_.sidecar_extension);
}

fs::path
volzarr::SeriesConverter::reconstruction_path(
  const std::string& series_id) const
{
    return settings_.reconstructed_dir / series_id;
}

volzarr::ConversionPaths
volzarr::SeriesConverter::convert(const fs::path& series_dir)
{
    const auto series_id = series_dir.filename().string();

    LOG_INFO("Loading series ", series_id);
    auto series = loader_.load(series_dir);

    ConversionPaths paths{ store_path(series_id), sidecar_path(series_id) };

    LOG_INFO("Converting series ", series_id);
    store_writer_.write(series.volume, series.metadata.geometry,
                        paths.store_path);
    write_sidecar(series.metadata, paths.sidecar_path);

    LOG_INFO("Saved to ", paths.store_path, " and ", paths.sidecar_path);
    return paths;
}

volzarr::ReconstructionResult
volzarr::SeriesConverter::reconstruct(const std::string& series_id)
{
    LOG_INFO("Loading back series ", series_id);
    const ChunkedStoreReader reader(store_path(series_id));
    const auto volume = reader.read();
    const auto record = read_sidecar(sidecar_path(series_id));

    LOG_INFO("Reconstructing series ", series_id);
    auto result =
      volume_writer_.write(volume, record, reconstruction_path(series_id));

    LOG_INFO("Reconstructed to ",
             result.output_dir,
             " (",
             result.slices_written(),
             " of ",
             result.slices.size(),
             " slices)");
    return result;
}

volzarr::SeriesResult
volzarr::SeriesConverter::process(const fs::path& series_dir)
{
    SeriesResult result;
    result.series_id = series_dir.filename().string();

    LOG_INFO("Processing series: ", result.series_id);
    try {
        const auto paths = convert(series_dir);
        result.store_path = paths.store_path;
        result.sidecar_path = paths.sidecar_path;

        result.reconstruction = reconstruct(result.series_id);
        result.status = VolzarrSeriesStatus_Ok;
    } catch (const DiscoveryError& exc) {
        LOG_WARNING("Skipping series ", result.series_id, ": ", exc.what());
        result.status = VolzarrSeriesStatus_Skipped;
        result.reason = exc.what();
    } catch (const std::exception& exc) {
        LOG_ERROR("Series ", result.series_id, " failed: ", exc.what());
        result.status = VolzarrSeriesStatus_Failed;
        result.reason = exc.what();
    }

    return result;
}

std::vector<volzarr::SeriesResult>
volzarr::SeriesConverter::run()
{
    const auto& raw_dir = settings_.raw_dir;
    EXPECT_OR_THROW(IOError,
                    fs::is_directory(raw_dir),
                    "Raw directory ",
                    raw_dir,
                    " does not exist.");

    std::vector<fs::path> series_dirs;
    for (const auto& entry : fs::directory_iterator(raw_dir)) {
        if (entry.is_directory()) {
            series_dirs.push_back(entry.path());
        }
    }
    std::sort(series_dirs.begin(), series_dirs.end());

    std::vector<SeriesResult> results;
    if (series_dirs.empty()) {
        LOG_WARNING("No series folders found in ", raw_dir);
        return results;
    }

    for (const auto& series_dir : series_dirs) {
        results.push_back(process(series_dir));
    }

    return results;
}
