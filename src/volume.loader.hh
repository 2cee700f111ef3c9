#pragma once

#include "volzarr.hh"

#include <filesystem>
#include <memory>

namespace volzarr {
/**
 * @brief Loads one series through an injected SeriesSource.
 */
class VolumeLoader
{
  public:
    explicit VolumeLoader(std::shared_ptr<SeriesSource> source);

    /**
     * @brief Load the series in @p series_dir.
     * @details Geometry size and pixel type are taken from the assembled
     * volume. The returned record holds one filename and one tag map per
     * slice.
     * @throw DiscoveryError if the directory yields no series files.
     * @throw ReadError if the source fails or returns inconsistent data.
     */
    LoadedSeries load(const std::filesystem::path& series_dir);

  private:
    std::shared_ptr<SeriesSource> source_;
};
} // namespace volzarr
