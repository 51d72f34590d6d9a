#ifndef H_XZARRGUARD_TYPES_V0
#define H_XZARRGUARD_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        XzgStatusCode_Success = 0,
        XzgStatusCode_InvalidArgument,
        XzgStatusCode_InvalidCoordinate,
        XzgStatusCode_InvalidShape,
        XzgStatusCode_ManifestCorrupt,
        XzgStatusCode_StoreUnreadable,
        XzgStatusCode_UnsupportedStrategy,
        XzgStatusCode_IOError,
        XzgStatusCode_CompressionError,
        XzgStatusCode_InternalError,
        XzgStatusCodeCount,
    } XzgStatusCode;

    typedef enum
    {
        XzgLogLevel_Debug,
        XzgLogLevel_Info,
        XzgLogLevel_Warning,
        XzgLogLevel_Error,
        XzgLogLevel_None,
        XzgLogLevelCount
    } XzgLogLevel;

    /**
     * @brief How chunks declared as no-data are represented in a new store.
     * @details With XzgNoDataStrategy_Manifest the chunks are left absent and
     * sanctioned by a per-variable manifest. With
     * XzgNoDataStrategy_EmptyChunks they are written out filled with the fill
     * value and no manifest is produced.
     */
    typedef enum
    {
        XzgNoDataStrategy_Manifest = 0,
        XzgNoDataStrategy_EmptyChunks,
        XzgNoDataStrategyCount
    } XzgNoDataStrategy;

    typedef enum
    {
        XzgDataType_uint8,
        XzgDataType_uint16,
        XzgDataType_uint32,
        XzgDataType_uint64,
        XzgDataType_int8,
        XzgDataType_int16,
        XzgDataType_int32,
        XzgDataType_int64,
        XzgDataType_float32,
        XzgDataType_float64,
        XzgDataTypeCount
    } XzgDataType;

    typedef enum
    {
        XzgCompressionCodec_None = 0,
        XzgCompressionCodec_BloscLZ4,
        XzgCompressionCodec_BloscZstd,
        XzgCompressionCodecCount
    } XzgCompressionCodec;

#ifdef __cplusplus
}
#endif

#endif // H_XZARRGUARD_TYPES_V0
