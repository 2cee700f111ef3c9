#ifndef H_VOLZARR_TYPES_V0
#define H_VOLZARR_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        VolzarrLogLevel_Debug,
        VolzarrLogLevel_Info,
        VolzarrLogLevel_Warning,
        VolzarrLogLevel_Error,
        VolzarrLogLevel_None,
        VolzarrLogLevelCount
    } VolzarrLogLevel;

    typedef enum
    {
        VolzarrDataType_uint8,
        VolzarrDataType_uint16,
        VolzarrDataType_uint32,
        VolzarrDataType_uint64,
        VolzarrDataType_int8,
        VolzarrDataType_int16,
        VolzarrDataType_int32,
        VolzarrDataType_int64,
        VolzarrDataType_float32,
        VolzarrDataType_float64,
        VolzarrDataTypeCount
    } VolzarrDataType;

    typedef enum
    {
        VolzarrByteOrder_Little,
        VolzarrByteOrder_Big,
        VolzarrByteOrderCount
    } VolzarrByteOrder;

    typedef enum
    {
        VolzarrSeriesStatus_Ok,
        VolzarrSeriesStatus_Skipped,
        VolzarrSeriesStatus_Failed,
        VolzarrSeriesStatusCount
    } VolzarrSeriesStatus;

#ifdef __cplusplus
}
#endif

#endif // H_VOLZARR_TYPES_V0
