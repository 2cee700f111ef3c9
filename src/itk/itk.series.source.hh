#pragma once

#include "volzarr.hh"

namespace volzarr {
/**
 * @brief SeriesSource for DICOM directories, backed by ITK and GDCM.
 * @details Files are ordered by GDCM's series sorting. Tags of every slice
 * are captured, private tags included.
 */
class ItkSeriesSource : public SeriesSource
{
  public:
    std::vector<std::string> list_series_files(
      const std::filesystem::path& series_dir) override;

    SeriesImage read_series(const std::vector<std::string>& files) override;
};
} // namespace volzarr
