#pragma once

#include "volzarr.common.hh"
#include "volzarr.hh"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace volzarr::test {
/// A volume whose sample at flat index i holds (i * 7 + 3), cast to T.
template<typename T>
Volume
make_volume(size_t depth,
            size_t height,
            size_t width,
            VolzarrDataType dtype)
{
    Volume volume;
    volume.shape = { depth, height, width };
    volume.dtype = dtype;
    volume.byte_order = native_byte_order();

    const size_t n = depth * height * width;
    volume.data.resize(n * sizeof(T));
    for (size_t i = 0; i < n; ++i) {
        const T value = static_cast<T>(i * 7 + 3);
        std::memcpy(volume.data.data() + i * sizeof(T), &value, sizeof(T));
    }

    return volume;
}

/// Tags resembling what a DICOM reader reports for slice `index`.
inline TagMap
make_slice_tags(size_t index)
{
    return {
        { "0008|0060", "CT" },
        { "0020|0013", std::to_string(index + 1) },
        { "0020|0032", "0\\0\\" + std::to_string(index * 2.5) },
    };
}

/// A SeriesSource serving series registered in memory, keyed by directory.
class FakeSeriesSource : public SeriesSource
{
  public:
    void add_series(const std::filesystem::path& series_dir,
                    const std::vector<std::string>& files,
                    const SeriesImage& image)
    {
        series_[series_dir.lexically_normal().string()] = { files, image };
    }

    /// Register a series with `depth` slices of 16-bit signed samples.
    void add_series(const std::filesystem::path& series_dir, size_t depth)
    {
        std::vector<std::string> files;
        SeriesImage image;
        image.volume = make_volume<int16_t>(depth, 4, 5, VolzarrDataType_int16);
        image.geometry.origin = { -10.0, 20.0, 30.0 };
        image.geometry.spacing = { 0.5, 0.5, 2.5 };
        for (size_t i = 0; i < depth; ++i) {
            files.push_back(
              (series_dir / ("IM" + std::to_string(i) + ".dcm")).string());
            image.slice_tags.push_back(make_slice_tags(i));
        }
        add_series(series_dir, files, image);
    }

    void fail_reading(const std::filesystem::path& series_dir)
    {
        failing_.insert(series_dir.lexically_normal().string());
    }

    std::vector<std::string> list_series_files(
      const std::filesystem::path& series_dir) override
    {
        auto it = series_.find(series_dir.lexically_normal().string());
        if (it == series_.end()) {
            return {};
        }
        return it->second.files;
    }

    SeriesImage read_series(const std::vector<std::string>& files) override
    {
        for (const auto& [dir, entry] : series_) {
            if (entry.files == files) {
                if (failing_.contains(dir)) {
                    throw ReadError("Corrupt slice in " + dir);
                }
                return entry.image;
            }
        }
        throw ReadError("Unknown files");
    }

  private:
    struct Entry
    {
        std::vector<std::string> files;
        SeriesImage image;
    };

    std::map<std::string, Entry> series_;
    std::set<std::string> failing_;
};

/// A SliceWriter that dumps raw plane bytes and remembers every slice.
class RawSliceWriter : public SliceWriter
{
  public:
    std::set<size_t> failing_indices;
    std::set<std::string> rejected_keys;
    std::map<std::string, Slice> written; /* keyed by file name */

    std::string default_extension() const override { return ".raw"; }

    void attach_tag(Slice& slice,
                    const std::string& key,
                    const std::string& value) override
    {
        if (rejected_keys.contains(key)) {
            throw TagAttachError("Rejected key " + key);
        }
        slice.tags[key] = value;
    }

    void write(const Slice& slice, const std::filesystem::path& path) override
    {
        if (failing_indices.contains(slice.index)) {
            throw WriteError("Refusing to write slice " +
                             std::to_string(slice.index));
        }

        std::ofstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw WriteError("Failed to open " + path.string());
        }
        file.write(reinterpret_cast<const char*>(slice.data.data()),
                   static_cast<std::streamsize>(slice.data.size()));

        written[path.filename().string()] = slice;
    }
};

/// Names of the regular files in `dir`, sorted.
inline std::vector<std::string>
list_file_names(const std::filesystem::path& dir)
{
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}
} // namespace volzarr::test
