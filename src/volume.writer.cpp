#include "volume.writer.hh"
#include "macros.hh"
#include "volzarr.common.hh"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace {
void
prepare_output_directory(const fs::path& output_dir)
{
    std::error_code ec;
    if (fs::exists(output_dir, ec)) {
        LOG_DEBUG("Removing existing output directory ", output_dir);
        fs::remove_all(output_dir, ec);
        EXPECT_OR_THROW(volzarr::WriteError,
                        !ec,
                        "Failed to remove ",
                        output_dir,
                        ": ",
                        ec.message());
    }

    fs::create_directories(output_dir, ec);
    EXPECT_OR_THROW(volzarr::WriteError,
                    !ec && fs::is_directory(output_dir),
                    "Failed to create output directory ",
                    output_dir,
                    ": ",
                    ec.message());
}
} // namespace

size_t
volzarr::ReconstructionResult::slices_written() const
{
    return std::count_if(slices.begin(), slices.end(), [](const auto& s) {
        return s.written;
    });
}

size_t
volzarr::ReconstructionResult::slices_failed() const
{
    return slices.size() - slices_written();
}

std::string
volzarr::slice_file_name(size_t index,
                         const std::vector<std::string>& filenames,
                         std::string_view default_extension)
{
    if (index < filenames.size()) {
        return fs::path(filenames[index]).filename().string();
    }

    // an extensionless first filename yields extensionless fallbacks
    const std::string extension =
      filenames.empty() ? std::string(default_extension)
                        : fs::path(filenames.front()).extension().string();

    std::ostringstream ss;
    ss << std::setw(4) << std::setfill('0') << index << extension;
    return ss.str();
}

volzarr::VolumeWriter::VolumeWriter(std::shared_ptr<SliceWriter> writer)
  : writer_{ writer }
{
    EXPECT(writer_, "Slice writer must not be null.");
}

volzarr::ReconstructionResult
volzarr::VolumeWriter::write(const Volume& volume,
                             const MetadataRecord& record,
                             const fs::path& output_dir)
{
    prepare_output_directory(output_dir);

    ReconstructionResult result;
    result.output_dir = output_dir;

    const auto default_extension = writer_->default_extension();
    const auto& filenames = record.filenames;
    const auto& slices_metadata = record.slices_metadata;

    for (auto i = 0; i < volume.depth(); ++i) {
        SliceOutcome outcome;
        outcome.index = i;
        outcome.path =
          output_dir / slice_file_name(i, filenames, default_extension);

        try {
            auto slice = make_slice_(volume, record.geometry, i);
            if (i < slices_metadata.size()) {
                attach_tags_(slice, slices_metadata[i], outcome.tags);
            }

            writer_->write(slice, outcome.path);
            outcome.written = true;
        } catch (const std::exception& exc) {
            outcome.error = exc.what();
            LOG_ERROR("Error writing slice ", i, ": ", exc.what());
        }

        result.slices.push_back(std::move(outcome));
    }

    if (const auto n_failed = result.slices_failed(); n_failed > 0) {
        LOG_WARNING(n_failed,
                    " of ",
                    volume.depth(),
                    " slices failed to write to ",
                    output_dir);
    }

    return result;
}

volzarr::Slice
volzarr::VolumeWriter::make_slice_(const Volume& volume,
                                   const Geometry& geometry,
                                   size_t index) const
{
    const auto plane = volume.plane(index);

    Slice slice;
    slice.index = index;
    slice.height = volume.height();
    slice.width = volume.width();
    slice.dtype = volume.dtype;
    slice.data.assign(plane.begin(), plane.end());
    if (volume.byte_order != native_byte_order()) {
        swap_byte_order(slice.data, bytes_of_type(volume.dtype));
    }

    slice.spacing = geometry.spacing;
    slice.direction = geometry.direction;

    // physical position of voxel (0, 0, index)
    const double offset = static_cast<double>(index) * geometry.spacing[2];
    for (auto row = 0; row < 3; ++row) {
        slice.origin[row] =
          geometry.origin[row] + geometry.direction[3 * row + 2] * offset;
    }

    return slice;
}

void
volzarr::VolumeWriter::attach_tags_(Slice& slice,
                                    const TagMap& tags,
                                    std::vector<TagOutcome>& outcomes)
{
    for (const auto& [key, value] : tags) {
        TagOutcome outcome{ key };
        try {
            writer_->attach_tag(slice, key, value);
            outcome.attached = true;
        } catch (const std::exception& exc) {
            outcome.error = exc.what();
            LOG_DEBUG("Skipping tag '", key, "' on slice ", slice.index, ": ",
                      exc.what());
        }
        outcomes.push_back(std::move(outcome));
    }
}
