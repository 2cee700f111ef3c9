#ifndef H_VOLZARR_V0
#define H_VOLZARR_V0

#include "volzarr.types.h"

#include <array>
#include <cstddef>
#include <filesystem>
#include <map>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace volzarr {
/**
 * @brief Flat per-slice tag mapping. Keys and values are plain strings;
 * consumers reparse values as needed.
 */
using TagMap = std::map<std::string, std::string>;

/**
 * @brief A dense 3D array of scalar samples, stored in (z, y, x) order.
 */
struct Volume
{
    std::array<size_t, 3> shape{}; /* depth, height, width */
    VolzarrDataType dtype{ VolzarrDataType_uint8 };
    VolzarrByteOrder byte_order{ VolzarrByteOrder_Little };
    std::vector<std::byte> data;

    size_t depth() const { return shape[0]; }
    size_t height() const { return shape[1]; }
    size_t width() const { return shape[2]; }

    /**
     * @brief Number of bytes in a single (y, x) plane.
     */
    size_t bytes_of_plane() const;

    /**
     * @brief Number of bytes the full array should occupy.
     */
    size_t bytes_of_volume() const;

    /**
     * @brief View of the @p z-th plane.
     * @throw std::out_of_range if @p z is not less than the depth.
     */
    std::span<const std::byte> plane(size_t z) const;
};

/**
 * @brief Physical placement and source pixel type of a volume.
 * @details Origin, spacing and size are in (x, y, z) order. Direction is a
 * row-major 3x3 matrix.
 */
struct Geometry
{
    std::array<double, 3> origin{ 0.0, 0.0, 0.0 };
    std::array<double, 3> spacing{ 1.0, 1.0, 1.0 };
    std::array<double, 9> direction{ 1.0, 0.0, 0.0, 0.0, 1.0,
                                     0.0, 0.0, 0.0, 1.0 };
    std::array<uint64_t, 3> size{ 0, 0, 0 };
    int pixel_id{ -1 };
    std::string pixel_id_type_as_string;
};

/**
 * @brief Everything the sidecar carries for one series.
 */
struct MetadataRecord
{
    std::vector<std::string> filenames; /* empty, or one per slice */
    Geometry geometry;
    std::vector<TagMap> slices_metadata; /* aligned with slice index */
};

/**
 * @brief What a SeriesSource hands back after reading a series.
 */
struct SeriesImage
{
    Volume volume;
    Geometry geometry;
    std::vector<TagMap> slice_tags; /* one map per slice */
};

/**
 * @brief A volume together with the metadata captured while loading it.
 */
struct LoadedSeries
{
    Volume volume;
    MetadataRecord metadata;
};

/**
 * @brief A single plane handed to a SliceWriter.
 * @details Pixel data is in native byte order. Origin is the physical
 * position of the slice's first voxel; spacing and direction are inherited
 * from the volume.
 */
struct Slice
{
    size_t index{ 0 };
    size_t height{ 0 };
    size_t width{ 0 };
    VolzarrDataType dtype{ VolzarrDataType_uint8 };
    std::vector<std::byte> data;

    std::array<double, 3> origin{ 0.0, 0.0, 0.0 };
    std::array<double, 3> spacing{ 1.0, 1.0, 1.0 };
    std::array<double, 9> direction{ 1.0, 0.0, 0.0, 0.0, 1.0,
                                     0.0, 0.0, 0.0, 1.0 };

    TagMap tags;
};

struct TagOutcome
{
    std::string key;
    bool attached{ false };
    std::string error;
};

struct SliceOutcome
{
    size_t index{ 0 };
    std::filesystem::path path;
    bool written{ false };
    std::string error;
    std::vector<TagOutcome> tags;
};

struct ReconstructionResult
{
    std::filesystem::path output_dir;
    std::vector<SliceOutcome> slices;

    size_t slices_written() const;
    size_t slices_failed() const;
};

struct SeriesResult
{
    std::string series_id;
    VolzarrSeriesStatus status{ VolzarrSeriesStatus_Failed };
    std::string reason;
    std::filesystem::path store_path;
    std::filesystem::path sidecar_path;
    ReconstructionResult reconstruction;
};

/**
 * @brief Source-format capability: enumerates and reads one series.
 */
class SeriesSource
{
  public:
    virtual ~SeriesSource() = default;

    /**
     * @brief List the member files of the series in @p series_dir, in slice
     * order.
     * @return The ordered file paths, or an empty list if the directory holds
     * no series.
     */
    virtual std::vector<std::string> list_series_files(
      const std::filesystem::path& series_dir) = 0;

    /**
     * @brief Read @p files into a single volume, capturing the tags of every
     * slice.
     * @throw ReadError if the files cannot be read.
     */
    virtual SeriesImage read_series(const std::vector<std::string>& files) = 0;
};

/**
 * @brief Target-format capability: writes one slice file.
 */
class SliceWriter
{
  public:
    virtual ~SliceWriter() = default;

    /**
     * @brief Extension, including the leading dot, used when no source
     * filename is available.
     */
    virtual std::string default_extension() const = 0;

    /**
     * @brief Attach a single tag to @p slice.
     * @throw TagAttachError if the tag cannot be represented.
     */
    virtual void attach_tag(Slice& slice,
                            const std::string& key,
                            const std::string& value) = 0;

    /**
     * @brief Write @p slice to @p path.
     * @throw WriteError on failure.
     */
    virtual void write(const Slice& slice,
                       const std::filesystem::path& path) = 0;
};

class Error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class DiscoveryError : public Error
{
  public:
    using Error::Error;
};

class WriteError : public Error
{
  public:
    using Error::Error;
};

class ReadError : public Error
{
  public:
    using Error::Error;
};

class ParseError : public Error
{
  public:
    using Error::Error;
};

class IOError : public Error
{
  public:
    using Error::Error;
};

class TagAttachError : public Error
{
  public:
    using Error::Error;
};

class SettingsError : public Error
{
  public:
    using Error::Error;
};
} // namespace volzarr

#endif // H_VOLZARR_V0
