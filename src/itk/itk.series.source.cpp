#include "itk.series.source.hh"
#include "itk.pixel.types.hh"
#include "macros.hh"
#include "volzarr.common.hh"

#include <itkGDCMImageIO.h>
#include <itkGDCMSeriesFileNames.h>
#include <itkImage.h>
#include <itkImageSeriesReader.h>
#include <itkMetaDataObject.h>

#include <cstring>

namespace fs = std::filesystem;

namespace {
template<typename T>
volzarr::SeriesImage
read_series_as(const std::vector<std::string>& files, VolzarrDataType dtype)
{
    using ImageType = itk::Image<T, 3>;
    using ReaderType = itk::ImageSeriesReader<ImageType>;

    auto gdcm_io = itk::GDCMImageIO::New();
    gdcm_io->LoadPrivateTagsOn();

    auto reader = ReaderType::New();
    reader->SetImageIO(gdcm_io);
    reader->SetFileNames(files);
    // per-slice dictionaries, not just the first slice's
    reader->MetaDataDictionaryArrayUpdateOn();
    reader->Update();

    const typename ImageType::Pointer image = reader->GetOutput();
    const auto size = image->GetLargestPossibleRegion().GetSize();

    volzarr::SeriesImage series;
    auto& volume = series.volume;
    volume.shape = { size[2], size[1], size[0] };
    volume.dtype = dtype;
    volume.byte_order = volzarr::native_byte_order();
    volume.data.resize(volume.bytes_of_volume());
    std::memcpy(volume.data.data(),
                image->GetBufferPointer(),
                volume.data.size());

    auto& geometry = series.geometry;
    const auto& origin = image->GetOrigin();
    const auto& spacing = image->GetSpacing();
    const auto& direction = image->GetDirection();
    for (auto i = 0; i < 3; ++i) {
        geometry.origin[i] = origin[i];
        geometry.spacing[i] = spacing[i];
        for (auto j = 0; j < 3; ++j) {
            geometry.direction[3 * i + j] = direction(i, j);
        }
    }

    const auto* dictionaries = reader->GetMetaDataDictionaryArray();
    for (const auto* dictionary : *dictionaries) {
        volzarr::TagMap tags;
        if (dictionary != nullptr) {
            for (const auto& key : dictionary->GetKeys()) {
                std::string value;
                if (itk::ExposeMetaData<std::string>(
                      *dictionary, key, value)) {
                    tags.emplace(key, value);
                }
            }
        }
        series.slice_tags.push_back(std::move(tags));
    }

    return series;
}
} // namespace

std::vector<std::string>
volzarr::ItkSeriesSource::list_series_files(const fs::path& series_dir)
{
    try {
        auto names = itk::GDCMSeriesFileNames::New();
        names->SetDirectory(series_dir.string());

        const auto& series_uids = names->GetSeriesUIDs();
        if (series_uids.empty()) {
            return {};
        }

        if (series_uids.size() > 1) {
            LOG_WARNING(series_dir,
                        " holds ",
                        series_uids.size(),
                        " series; using ",
                        series_uids.front());
        }

        return names->GetFileNames(series_uids.front());
    } catch (const itk::ExceptionObject& exc) {
        const std::string err = LOG_ERROR(
          "Failed to scan ", series_dir, " for DICOM series: ", exc.what());
        throw DiscoveryError(err);
    }
}

volzarr::SeriesImage
volzarr::ItkSeriesSource::read_series(const std::vector<std::string>& files)
{
    EXPECT_OR_THROW(ReadError, !files.empty(), "No files to read.");

    try {
        auto image_io = itk::GDCMImageIO::New();
        image_io->SetFileName(files.front());
        image_io->ReadImageInformation();
        const auto dtype =
          itk_adapter::data_type_of(image_io->GetComponentType());

        return itk_adapter::visit_data_type(dtype, [&](auto sample) {
            return read_series_as<decltype(sample)>(files, dtype);
        });
    } catch (const itk::ExceptionObject& exc) {
        const std::string err =
          LOG_ERROR("Failed to read DICOM series: ", exc.what());
        throw ReadError(err);
    } catch (const std::invalid_argument& exc) {
        const std::string err =
          LOG_ERROR("Failed to read DICOM series: ", exc.what());
        throw ReadError(err);
    }
}
