#ifndef MC_LOG_H
#define MC_LOG_H

/// @file mc_log.h
/// @brief Mosaic logging

#include "mc_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/// Log levels
typedef enum {
    MC_LOG_DEBUG = 0,  ///< Debug messages
    MC_LOG_INFO = 1,   ///< Informational messages
    MC_LOG_WARN = 2,   ///< Warnings
    MC_LOG_ERROR = 3   ///< Errors
} mc_log_level;

/// Callback for intercepting log output
/// @param level Message level
/// @param message Formatted message text
typedef void (*mc_log_callback)(mc_log_level level, const char* message);

/// Installs a callback that receives every message instead of stderr
/// @param callback Handler, or NULL to restore the stderr sink
MC_API void mc_log_set_callback(mc_log_callback callback);

/// Returns the installed callback, NULL when the stderr sink is active
MC_API mc_log_callback mc_log_get_callback(void);

/// Returns "DEBUG", "INFO", "WARN" or "ERROR"
MC_API const char* mc_log_level_name(mc_log_level level);

/// Sets the minimum level
/// @param min_level Messages below this level are dropped
MC_API void mc_log_set_level(mc_log_level min_level);

/// Returns the current minimum level
MC_API mc_log_level mc_log_get_level(void);

/// Writes a message at the given level
/// @param level Message level
/// @param format printf-style format string
MC_API void mc_log(mc_log_level level, const char* format, ...);

/// @param format printf-style format string
MC_API void mc_log_debug(const char* format, ...);

/// @param format printf-style format string
MC_API void mc_log_info(const char* format, ...);

/// @param format printf-style format string
MC_API void mc_log_warn(const char* format, ...);

/// @param format printf-style format string
MC_API void mc_log_error(const char* format, ...);

#ifdef __cplusplus
}
#endif

#endif // MC_LOG_H
