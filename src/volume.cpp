#include "volzarr.common.hh"

#include <stdexcept>

size_t
volzarr::Volume::bytes_of_plane() const
{
    return bytes_of_type(dtype) * height() * width();
}

size_t
volzarr::Volume::bytes_of_volume() const
{
    return bytes_of_plane() * depth();
}

std::span<const std::byte>
volzarr::Volume::plane(size_t z) const
{
    if (z >= depth()) {
        throw std::out_of_range("Plane " + std::to_string(z) +
                                " out of range for depth " +
                                std::to_string(depth()));
    }

    const auto nbytes = bytes_of_plane();
    if (data.size() < (z + 1) * nbytes) {
        throw std::out_of_range("Plane " + std::to_string(z) +
                                " lies past the end of the volume buffer");
    }

    return { data.data() + z * nbytes, nbytes };
}
