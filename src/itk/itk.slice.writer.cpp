#include "itk.slice.writer.hh"
#include "itk.pixel.types.hh"
#include "macros.hh"

#include <itkGDCMImageIO.h>
#include <itkImage.h>
#include <itkImageFileWriter.h>
#include <itkMetaDataObject.h>

#include <cctype>
#include <cstring>

namespace fs = std::filesystem;

namespace {
bool
is_dicom_tag_key(const std::string& key)
{
    if (key.size() != 9 || key[4] != '|') {
        return false;
    }

    for (auto i = 0; i < key.size(); ++i) {
        if (i != 4 && !std::isxdigit(static_cast<unsigned char>(key[i]))) {
            return false;
        }
    }

    return true;
}

template<typename T>
void
write_slice_as(const volzarr::Slice& slice, const fs::path& path)
{
    using ImageType = itk::Image<T, 3>;
    using WriterType = itk::ImageFileWriter<ImageType>;

    typename ImageType::RegionType region;
    typename ImageType::SizeType size;
    size[0] = slice.width;
    size[1] = slice.height;
    size[2] = 1;
    region.SetSize(size);

    auto image = ImageType::New();
    image->SetRegions(region);
    image->Allocate();

    const auto nbytes = slice.width * slice.height * sizeof(T);
    EXPECT_OR_THROW(volzarr::WriteError,
                    slice.data.size() == nbytes,
                    "Slice ",
                    slice.index,
                    " holds ",
                    slice.data.size(),
                    " bytes, expected ",
                    nbytes);
    std::memcpy(image->GetBufferPointer(), slice.data.data(), nbytes);

    typename ImageType::PointType origin;
    typename ImageType::SpacingType spacing;
    typename ImageType::DirectionType direction;
    for (auto i = 0; i < 3; ++i) {
        origin[i] = slice.origin[i];
        spacing[i] = slice.spacing[i];
        for (auto j = 0; j < 3; ++j) {
            direction(i, j) = slice.direction[3 * i + j];
        }
    }
    image->SetOrigin(origin);
    image->SetSpacing(spacing);
    image->SetDirection(direction);

    itk::MetaDataDictionary dictionary;
    for (const auto& [key, value] : slice.tags) {
        itk::EncapsulateMetaData<std::string>(dictionary, key, value);
    }
    image->SetMetaDataDictionary(dictionary);

    auto gdcm_io = itk::GDCMImageIO::New();
    gdcm_io->KeepOriginalUIDOn();

    auto writer = WriterType::New();
    writer->SetImageIO(gdcm_io);
    writer->SetFileName(path.string());
    writer->SetInput(image);
    writer->Update();
}
} // namespace

std::string
volzarr::ItkSliceWriter::default_extension() const
{
    return ".dcm";
}

void
volzarr::ItkSliceWriter::attach_tag(Slice& slice,
                                    const std::string& key,
                                    const std::string& value)
{
    if (!is_dicom_tag_key(key)) {
        throw TagAttachError("'" + key + "' is not a DICOM tag key");
    }

    slice.tags[key] = value;
}

void
volzarr::ItkSliceWriter::write(const Slice& slice, const fs::path& path)
{
    try {
        itk_adapter::visit_data_type(slice.dtype, [&](auto sample) {
            write_slice_as<decltype(sample)>(slice, path);
        });
    } catch (const itk::ExceptionObject& exc) {
        throw WriteError("Failed to write " + path.string() + ": " +
                         exc.what());
    } catch (const std::invalid_argument& exc) {
        throw WriteError("Failed to write " + path.string() + ": " +
                         exc.what());
    }
}
