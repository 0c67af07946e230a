/**
 * @file wsf_structured_error.cpp
 * @brief whisper-safe - Structured Error Implementation
 */

#include "wsf/core/wsf_structured_error.h"

#include <cinttypes>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "wsf/core/wsf_logger.h"

// =============================================================================
// THREAD-LOCAL STORAGE
// =============================================================================

namespace {

thread_local wsf_error_t g_last_error;
thread_local bool g_has_last_error = false;

// Helper to safely copy strings
void safe_strcpy(char* dest, size_t dest_size, const char* src) {
    if (!dest || dest_size == 0) return;
    if (!src) {
        dest[0] = '\0';
        return;
    }
    size_t len = strlen(src);
    if (len >= dest_size) len = dest_size - 1;
    memcpy(dest, src, len);
    dest[len] = '\0';
}

const char* file_basename(const char* file) {
    const char* last_slash = strrchr(file, '/');
    const char* last_backslash = strrchr(file, '\\');
    const char* last_sep = (last_slash > last_backslash) ? last_slash : last_backslash;
    return last_sep ? last_sep + 1 : file;
}

}  // anonymous namespace

extern "C" {

// =============================================================================
// RECORDING
// =============================================================================

wsf_result_t wsf_set_error(wsf_result_t code, const char* message) {
    memset(&g_last_error, 0, sizeof(wsf_error_t));
    g_last_error.code = code;
    safe_strcpy(g_last_error.message, sizeof(g_last_error.message),
                message ? message : wsf_error_message(code));
    g_has_last_error = true;

    if (!wsf_error_is_expected(code)) {
        WSF_LOG_ERROR(wsf_error_category(code), "%s (code: %d)", g_last_error.message, code);
    }
    return code;
}

wsf_result_t wsf_set_error_at(wsf_result_t code, const char* message, const char* file,
                              int32_t line, const char* function) {
    wsf_set_error(code, message);
    if (file) {
        safe_strcpy(g_last_error.source_file, sizeof(g_last_error.source_file),
                    file_basename(file));
    }
    g_last_error.source_line = line;
    safe_strcpy(g_last_error.source_function, sizeof(g_last_error.source_function), function);
    return code;
}

wsf_result_t wsf_set_errorf(wsf_result_t code, const char* format, ...) {
    char buffer[WSF_MAX_ERROR_MESSAGE];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    return wsf_set_error(code, buffer);
}

void wsf_last_error_set_detail(int32_t index, const char* key, const char* value) {
    if (!g_has_last_error || index < 0 || index >= WSF_MAX_ERROR_DETAILS) return;
    safe_strcpy(g_last_error.detail_keys[index], WSF_MAX_ERROR_KEY, key);
    safe_strcpy(g_last_error.detail_values[index], WSF_MAX_ERROR_VALUE, value);
}

void wsf_last_error_set_detail_int(int32_t index, const char* key, int64_t value) {
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%" PRId64, value);
    wsf_last_error_set_detail(index, key, buffer);
}

void wsf_last_error_set_native_code(int32_t native_code) {
    if (!g_has_last_error) return;
    g_last_error.native_code = native_code;
}

// =============================================================================
// QUERY
// =============================================================================

const wsf_error_t* wsf_get_last_error(void) {
    return g_has_last_error ? &g_last_error : nullptr;
}

void wsf_clear_last_error(void) {
    memset(&g_last_error, 0, sizeof(wsf_error_t));
    g_has_last_error = false;
}

const char* wsf_error_detail(const wsf_error_t* error, const char* key) {
    if (!error || !key) return nullptr;
    for (int i = 0; i < WSF_MAX_ERROR_DETAILS; i++) {
        if (error->detail_keys[i][0] && strcmp(error->detail_keys[i], key) == 0) {
            return error->detail_values[i];
        }
    }
    return nullptr;
}

char* wsf_error_to_string(const wsf_error_t* error) {
    if (!error) return nullptr;

    size_t size = 1024;
    char* str = static_cast<char*>(malloc(size));
    if (!str) return nullptr;

    int pos = snprintf(str, size, "WhisperSafeError[%s.%s]: %s",
                       wsf_error_category(error->code), wsf_error_kind_name(error->code),
                       error->message);

    for (int i = 0; i < WSF_MAX_ERROR_DETAILS && pos < static_cast<int>(size); i++) {
        if (error->detail_keys[i][0]) {
            pos += snprintf(str + pos, size - pos, " %s=%s", error->detail_keys[i],
                            error->detail_values[i]);
        }
    }
    if (error->native_code != 0 && pos < static_cast<int>(size)) {
        pos += snprintf(str + pos, size - pos, " (native: %d)", error->native_code);
    }
    if (error->source_file[0] && pos < static_cast<int>(size)) {
        snprintf(str + pos, size - pos, "\n  At: %s:%d in %s", error->source_file,
                 error->source_line, error->source_function);
    }

    return str;
}

}  // extern "C"
