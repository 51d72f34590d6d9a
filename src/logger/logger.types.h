#ifndef H_XZARRGUARD_LOGGER_TYPES_V0
#define H_XZARRGUARD_LOGGER_TYPES_V0

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        LogLevel_Debug,
        LogLevel_Info,
        LogLevel_Warning,
        LogLevel_Error,
        LogLevel_None,
    } LogLevel;

#ifdef __cplusplus
}
#endif

#endif // H_XZARRGUARD_LOGGER_TYPES_V0
