#pragma once

#include "volzarr.hh"

#include <itkImageIOBase.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace volzarr::itk_adapter {
/**
 * @brief Data type matching an ITK component type.
 * @throw std::invalid_argument for component types with no counterpart.
 */
inline VolzarrDataType
data_type_of(itk::IOComponentEnum component)
{
    switch (component) {
        case itk::IOComponentEnum::UCHAR:
            return VolzarrDataType_uint8;
        case itk::IOComponentEnum::CHAR:
            return VolzarrDataType_int8;
        case itk::IOComponentEnum::USHORT:
            return VolzarrDataType_uint16;
        case itk::IOComponentEnum::SHORT:
            return VolzarrDataType_int16;
        case itk::IOComponentEnum::UINT:
            return VolzarrDataType_uint32;
        case itk::IOComponentEnum::INT:
            return VolzarrDataType_int32;
        case itk::IOComponentEnum::ULONG:
            return sizeof(unsigned long) == 8 ? VolzarrDataType_uint64
                                              : VolzarrDataType_uint32;
        case itk::IOComponentEnum::LONG:
            return sizeof(long) == 8 ? VolzarrDataType_int64
                                     : VolzarrDataType_int32;
        case itk::IOComponentEnum::ULONGLONG:
            return VolzarrDataType_uint64;
        case itk::IOComponentEnum::LONGLONG:
            return VolzarrDataType_int64;
        case itk::IOComponentEnum::FLOAT:
            return VolzarrDataType_float32;
        case itk::IOComponentEnum::DOUBLE:
            return VolzarrDataType_float64;
        default:
            throw std::invalid_argument(
              "Unsupported ITK component type: " +
              itk::ImageIOBase::GetComponentTypeAsString(component));
    }
}

/**
 * @brief Call @p fn with a value-initialized object of the C++ type matching
 * @p dtype, so it can dispatch to a typed template.
 */
template<typename Fn>
decltype(auto)
visit_data_type(VolzarrDataType dtype, Fn&& fn)
{
    switch (dtype) {
        case VolzarrDataType_uint8:
            return std::forward<Fn>(fn)(uint8_t{});
        case VolzarrDataType_int8:
            return std::forward<Fn>(fn)(int8_t{});
        case VolzarrDataType_uint16:
            return std::forward<Fn>(fn)(uint16_t{});
        case VolzarrDataType_int16:
            return std::forward<Fn>(fn)(int16_t{});
        case VolzarrDataType_uint32:
            return std::forward<Fn>(fn)(uint32_t{});
        case VolzarrDataType_int32:
            return std::forward<Fn>(fn)(int32_t{});
        case VolzarrDataType_uint64:
            return std::forward<Fn>(fn)(uint64_t{});
        case VolzarrDataType_int64:
            return std::forward<Fn>(fn)(int64_t{});
        case VolzarrDataType_float32:
            return std::forward<Fn>(fn)(float{});
        case VolzarrDataType_float64:
            return std::forward<Fn>(fn)(double{});
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(dtype));
    }
}
} // namespace volzarr::itk_adapter
