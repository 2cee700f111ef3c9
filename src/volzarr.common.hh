#pragma once

#include "volzarr.hh"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace volzarr {
/**
 * @brief Trim whitespace from a string.
 * @param s The string to trim.
 * @return The string with leading and trailing whitespace removed.
 */
[[nodiscard]]
std::string
trim(std::string_view s);

/**
 * @brief Check if a string is empty, including whitespace.
 * @param s The string to check.
 * @param err_on_empty The message to log if the string is empty.
 * @return True if the string is empty, false otherwise.
 */
bool
is_empty_string(std::string_view s, std::string_view err_on_empty);

/**
 * @brief Read a non-negative integer no greater than @p max from @p value.
 * @return False, leaving @p out untouched, if @p value is not an integer
 * (floats included) or is out of range.
 */
[[nodiscard]]
bool
unsigned_from_json(const nlohmann::json& value, uint64_t max, uint64_t& out);

/**
 * @brief Get the number of bytes for a given data type.
 * @param data_type The data type.
 * @return The number of bytes for the data type.
 * @throw std::invalid_argument if the data type is not recognized.
 */
size_t
bytes_of_type(VolzarrDataType data_type);

/**
 * @brief Zarr v3 name of a data type, e.g. "uint16".
 * @throw std::invalid_argument if the data type is not recognized.
 */
std::string
data_type_to_string(VolzarrDataType data_type);

/**
 * @brief Inverse of data_type_to_string.
 * @throw std::invalid_argument if @p name is not a supported data type.
 */
VolzarrDataType
data_type_from_string(std::string_view name);

/**
 * @brief Byte order of the machine running this code.
 */
VolzarrByteOrder
native_byte_order() noexcept;

/**
 * @brief "little" or "big".
 */
std::string
byte_order_to_string(VolzarrByteOrder order);

/**
 * @throw std::invalid_argument if @p name is neither "little" nor "big".
 */
VolzarrByteOrder
byte_order_from_string(std::string_view name);

/**
 * @brief Reverse the bytes of every @p bytes_per_element-wide element of
 * @p buf in place.
 * @throw std::invalid_argument if the buffer is not a whole number of
 * elements.
 */
void
swap_byte_order(std::span<std::byte> buf, size_t bytes_per_element);

/**
 * @brief Pixel identifier recorded in the sidecar for @p data_type.
 * @details Matches the SimpleITK numbering (Int8=0 ... Float64=9).
 */
int
pixel_id_of(VolzarrDataType data_type);

/**
 * @brief Display string paired with pixel_id_of, e.g.
 * "16-bit signed integer".
 */
std::string
pixel_id_type_as_string(VolzarrDataType data_type);
} // namespace volzarr
