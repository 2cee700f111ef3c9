#include "macros.hh"
#include "volzarr.common.hh"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <bit>
#include <cctype>
#include <stdexcept>

std::string
volzarr::trim(std::string_view s)
{
    if (s.empty()) {
        return {};
    }

    // trim left
    std::string trimmed(s);
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), [](char c) {
                      return !std::isspace(static_cast<unsigned char>(c));
                  }));

    // trim right
    trimmed.erase(std::find_if(trimmed.rbegin(),
                               trimmed.rend(),
                               [](char c) {
                                   return !std::isspace(
                                     static_cast<unsigned char>(c));
                               })
                    .base(),
                  trimmed.end());

    return trimmed;
}

bool
volzarr::is_empty_string(std::string_view s, std::string_view err_on_empty)
{
    auto trimmed = trim(s);
    if (trimmed.empty()) {
        LOG_ERROR(err_on_empty);
        return true;
    }
    return false;
}

bool
volzarr::unsigned_from_json(const nlohmann::json& value,
                            uint64_t max,
                            uint64_t& out)
{
    uint64_t result;
    if (value.is_number_unsigned()) {
        result = value.get<uint64_t>();
    } else if (value.is_number_integer()) {
        const auto signed_value = value.get<int64_t>();
        if (signed_value < 0) {
            return false;
        }
        result = static_cast<uint64_t>(signed_value);
    } else {
        return false;
    }

    if (result > max) {
        return false;
    }

    out = result;
    return true;
}

size_t
volzarr::bytes_of_type(VolzarrDataType data_type)
{
    switch (data_type) {
        case VolzarrDataType_int8:
        case VolzarrDataType_uint8:
            return 1;
        case VolzarrDataType_int16:
        case VolzarrDataType_uint16:
            return 2;
        case VolzarrDataType_int32:
        case VolzarrDataType_uint32:
        case VolzarrDataType_float32:
            return 4;
        case VolzarrDataType_int64:
        case VolzarrDataType_uint64:
        case VolzarrDataType_float64:
            return 8;
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}

std::string
volzarr::data_type_to_string(VolzarrDataType data_type)
{
    switch (data_type) {
        case VolzarrDataType_uint8:
            return "uint8";
        case VolzarrDataType_uint16:
            return "uint16";
        case VolzarrDataType_uint32:
            return "uint32";
        case VolzarrDataType_uint64:
            return "uint64";
        case VolzarrDataType_int8:
            return "int8";
        case VolzarrDataType_int16:
            return "int16";
        case VolzarrDataType_int32:
            return "int32";
        case VolzarrDataType_int64:
            return "int64";
        case VolzarrDataType_float32:
            return "float32";
        case VolzarrDataType_float64:
            return "float64";
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}

VolzarrDataType
volzarr::data_type_from_string(std::string_view name)
{
    for (auto i = 0; i < VolzarrDataTypeCount; ++i) {
        const auto data_type = static_cast<VolzarrDataType>(i);
        if (data_type_to_string(data_type) == name) {
            return data_type;
        }
    }

    throw std::invalid_argument("Unsupported data type: " + std::string(name));
}

VolzarrByteOrder
volzarr::native_byte_order() noexcept
{
    return std::endian::native == std::endian::big ? VolzarrByteOrder_Big
                                                   : VolzarrByteOrder_Little;
}

std::string
volzarr::byte_order_to_string(VolzarrByteOrder order)
{
    switch (order) {
        case VolzarrByteOrder_Little:
            return "little";
        case VolzarrByteOrder_Big:
            return "big";
        default:
            throw std::invalid_argument("Invalid byte order: " +
                                        std::to_string(order));
    }
}

VolzarrByteOrder
volzarr::byte_order_from_string(std::string_view name)
{
    if (name == "little") {
        return VolzarrByteOrder_Little;
    }
    if (name == "big") {
        return VolzarrByteOrder_Big;
    }

    throw std::invalid_argument("Unsupported byte order: " +
                                std::string(name));
}

void
volzarr::swap_byte_order(std::span<std::byte> buf, size_t bytes_per_element)
{
    if (bytes_per_element < 2) {
        return;
    }

    if (buf.size() % bytes_per_element != 0) {
        throw std::invalid_argument(
          "Buffer of " + std::to_string(buf.size()) +
          " bytes is not a whole number of " +
          std::to_string(bytes_per_element) + "-byte elements");
    }

    for (auto it = buf.begin(); it != buf.end(); it += bytes_per_element) {
        std::reverse(it, it + bytes_per_element);
    }
}

int
volzarr::pixel_id_of(VolzarrDataType data_type)
{
    switch (data_type) {
        case VolzarrDataType_int8:
            return 0;
        case VolzarrDataType_uint8:
            return 1;
        case VolzarrDataType_int16:
            return 2;
        case VolzarrDataType_uint16:
            return 3;
        case VolzarrDataType_int32:
            return 4;
        case VolzarrDataType_uint32:
            return 5;
        case VolzarrDataType_int64:
            return 6;
        case VolzarrDataType_uint64:
            return 7;
        case VolzarrDataType_float32:
            return 8;
        case VolzarrDataType_float64:
            return 9;
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}

std::string
volzarr::pixel_id_type_as_string(VolzarrDataType data_type)
{
    switch (data_type) {
        case VolzarrDataType_int8:
            return "8-bit signed integer";
        case VolzarrDataType_uint8:
            return "8-bit unsigned integer";
        case VolzarrDataType_int16:
            return "16-bit signed integer";
        case VolzarrDataType_uint16:
            return "16-bit unsigned integer";
        case VolzarrDataType_int32:
            return "32-bit signed integer";
        case VolzarrDataType_uint32:
            return "32-bit unsigned integer";
        case VolzarrDataType_int64:
            return "64-bit signed integer";
        case VolzarrDataType_uint64:
            return "64-bit unsigned integer";
        case VolzarrDataType_float32:
            return "32-bit float";
        case VolzarrDataType_float64:
            return "64-bit float";
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}
