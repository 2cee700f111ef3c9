#pragma once

#include "chunked.store.writer.hh"
#include "converter.settings.hh"
#include "thread.pool.hh"
#include "volume.loader.hh"
#include "volume.writer.hh"
#include "volzarr.hh"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace volzarr {
struct ConversionPaths
{
    std::filesystem::path store_path;
    std::filesystem::path sidecar_path;
};

/**
 * @brief Drives the forward conversion and the reconstruction of series,
 * one series at a time.
 */
class SeriesConverter
{
  public:
    /**
     * @throw SettingsError if @p settings do not validate.
     */
    SeriesConverter(const ConverterSettings& settings,
                    std::shared_ptr<SeriesSource> source,
                    std::shared_ptr<SliceWriter> writer);

    const ConverterSettings& settings() const { return settings_; }

    std::filesystem::path store_path(const std::string& series_id) const;
    std::filesystem::path sidecar_path(const std::string& series_id) const;
    std::filesystem::path reconstruction_path(
      const std::string& series_id) const;

    /**
     * @brief Load the series in @p series_dir and write its store and
     * sidecar to the converted directory.
     * @throw DiscoveryError if the directory holds no series.
     * @throw ReadError, WriteError or IOError on failure.
     */
    ConversionPaths convert(const std::filesystem::path& series_dir);

    /**
     * @brief Rebuild the slice directory of @p series_id from its store and
     * sidecar.
     * @throw ReadError, ParseError, IOError or WriteError if the series
     * cannot be reconstructed at all. Individual slice failures are reported
     * in the result instead.
     */
    ReconstructionResult reconstruct(const std::string& series_id);

    /**
     * @brief Convert then reconstruct one series, never throwing for
     * series-level failures.
     */
    SeriesResult process(const std::filesystem::path& series_dir);

    /**
     * @brief Process every subdirectory of the raw directory, in name order.
     * @throw IOError if the raw directory does not exist.
     */
    std::vector<SeriesResult> run();

  private:
    ConverterSettings settings_;
    std::shared_ptr<ThreadPool> thread_pool_;
    VolumeLoader loader_;
    ChunkedStoreWriter store_writer_;
    VolumeWriter volume_writer_;
};
} // namespace volzarr
