#include "xzarrguard.h"
#include "file.store.hh"
#include "integrity.checker.hh"
#include "macros.hh"
#include "manifest.hh"
#include "store.creator.hh"

extern "C"
{
    const char* Xzg_get_api_version()
    {
        return XZARRGUARD_API_VERSION;
    }

    XzgStatusCode Xzg_set_log_level(XzgLogLevel level_)
    {
        LogLevel level;
        switch (level_) {
            case XzgLogLevel_Debug:
                level = LogLevel_Debug;
                break;
            case XzgLogLevel_Info:
                level = LogLevel_Info;
                break;
            case XzgLogLevel_Warning:
                level = LogLevel_Warning;
                break;
            case XzgLogLevel_Error:
                level = LogLevel_Error;
                break;
            case XzgLogLevel_None:
                level = LogLevel_None;
                break;
            default:
                return XzgStatusCode_InvalidArgument;
        }

        try {
            Logger::set_log_level(level);
        } catch (const std::exception& e) {
            LOG_ERROR("Error setting log level: ", e.what());
            return XzgStatusCode_InternalError;
        }
        return XzgStatusCode_Success;
    }

    XzgLogLevel Xzg_get_log_level()
    {
        XzgLogLevel level;
        switch (Logger::get_log_level()) {
            case LogLevel_Debug:
                level = XzgLogLevel_Debug;
                break;
            case LogLevel_Info:
                level = XzgLogLevel_Info;
                break;
            case LogLevel_Warning:
                level = XzgLogLevel_Warning;
                break;
            case LogLevel_None:
                level = XzgLogLevel_None;
                break;
            default:
                level = XzgLogLevel_Error;
                break;
        }
        return level;
    }

    const char* Xzg_get_status_message(XzgStatusCode code)
    {
        switch (code) {
            case XzgStatusCode_Success:
                return "Success";
            case XzgStatusCode_InvalidArgument:
                return "Invalid argument";
            case XzgStatusCode_InvalidCoordinate:
                return "Invalid chunk coordinate";
            case XzgStatusCode_InvalidShape:
                return "Invalid array shape";
            case XzgStatusCode_ManifestCorrupt:
                return "Corrupt manifest";
            case XzgStatusCode_StoreUnreadable:
                return "Store unreadable";
            case XzgStatusCode_UnsupportedStrategy:
                return "Unsupported no-data strategy";
            case XzgStatusCode_IOError:
                return "I/O error";
            case XzgStatusCode_CompressionError:
                return "Compression error";
            case XzgStatusCode_InternalError:
                return "Internal error";
            default:
                return "Unknown error";
        }
    }

    XzgStatusCode Xzg_check_store(const char* store_path,
                                  bool strict_stale,
                                  bool* ok)
    {
        EXPECT_VALID_ARGUMENT(store_path, "Null pointer: store_path");
        EXPECT_VALID_ARGUMENT(ok, "Null pointer: ok");

        *ok = false;
        try {
            xzarrguard::CheckOptions options;
            options.strict_stale = strict_stale;

            const auto report = xzarrguard::check_store(store_path, options);
            if (!report.errors.empty()) {
                LOG_ERROR("Failed to check ",
                          store_path,
                          ": ",
                          report.errors.front());
                return XzgStatusCode_StoreUnreadable;
            }

            *ok = static_cast<bool>(report);
        } catch (const xzarrguard::Error& e) {
            LOG_ERROR("Error checking store: ", e.what());
            return e.code();
        } catch (const std::exception& e) {
            LOG_ERROR("Error checking store: ", e.what());
            return XzgStatusCode_InternalError;
        }

        return XzgStatusCode_Success;
    }

    XzgStatusCode Xzg_create_store(const char* source_path,
                                   const char* target_path,
                                   const char* no_data_path,
                                   XzgNoDataStrategy strategy,
                                   bool overwrite)
    {
        EXPECT_VALID_ARGUMENT(source_path, "Null pointer: source_path");
        EXPECT_VALID_ARGUMENT(target_path, "Null pointer: target_path");

        try {
            const xzarrguard::FileStore source(source_path);
            const auto dataset = xzarrguard::read_dataset(source);

            xzarrguard::NoDataChunks no_data_chunks;
            if (no_data_path != nullptr) {
                no_data_chunks = xzarrguard::load_no_data_chunks(no_data_path);
            }

            xzarrguard::CreateOptions options;
            options.overwrite = overwrite;

            xzarrguard::create_store(
              dataset, target_path, no_data_chunks, strategy, options);
        } catch (const xzarrguard::Error& e) {
            LOG_ERROR("Error creating store: ", e.what());
            return e.code();
        } catch (const std::exception& e) {
            LOG_ERROR("Error creating store: ", e.what());
            return XzgStatusCode_InternalError;
        }

        return XzgStatusCode_Success;
    }
}
