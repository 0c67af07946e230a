/**
 * @file wsf_engine.cpp
 * @brief whisper-safe - Engine-wide Queries Implementation
 */

#include "wsf/features/stt/wsf_engine.h"

#include "wsf/core/wsf_config.h"
#include "wsf/core/wsf_structured_error.h"
#include "wsf/ffi/wsf_cstring_guard.h"

namespace whispersafe {

static constexpr size_t MAX_INFO_LEN = 4096;

int lang_max_id(const NativeApi* api) {
    return resolve_api(api).lang_max_id();
}

wsf_result_t lang_id(const std::string& lang, int* out, const NativeApi* api) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Language id output is null");
    }
    if (lang.empty() || lang.find('\0') != std::string::npos) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Invalid language string");
    }

    const NativeApi& native = resolve_api(api);
    const int id = native.lang_id(lang.c_str());
    if (id < 0 || id > native.lang_max_id()) {
        wsf_set_errorf(WSF_ERROR_INVALID_ARGUMENT, "Unknown language '%s'", lang.c_str());
        wsf_last_error_set_detail(0, "language", lang.c_str());
        return WSF_ERROR_INVALID_ARGUMENT;
    }
    *out = id;
    return WSF_SUCCESS;
}

static wsf_result_t check_lang_id(const NativeApi& native, int id) {
    const int max_id = native.lang_max_id();
    if (id < 0 || id > max_id) {
        wsf_set_errorf(WSF_ERROR_INDEX_OUT_OF_BOUNDS, "Language id %d outside [0, %d]", id,
                       max_id);
        wsf_last_error_set_detail_int(0, "id", id);
        return WSF_ERROR_INDEX_OUT_OF_BOUNDS;
    }
    return WSF_SUCCESS;
}

static size_t language_bound(const GuardLimits* limits) {
    return limits ? limits->max_language_len : GuardLimits().max_language_len;
}

wsf_result_t lang_str(int id, std::string* out, const NativeApi* api,
                      const GuardLimits* limits) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Language output is null");
    }
    const NativeApi& native = resolve_api(api);
    wsf_result_t rc = check_lang_id(native, id);
    if (rc != WSF_SUCCESS) return rc;

    return guard_string(native.lang_str(id), language_bound(limits), Utf8Policy::Strict, out);
}

wsf_result_t lang_str_full(int id, std::string* out, const NativeApi* api,
                           const GuardLimits* limits) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Language output is null");
    }
    const NativeApi& native = resolve_api(api);
    wsf_result_t rc = check_lang_id(native, id);
    if (rc != WSF_SUCCESS) return rc;

    return guard_string(native.lang_str_full(id), language_bound(limits), Utf8Policy::Strict,
                        out);
}

wsf_result_t engine_version(std::string* out, const NativeApi* api) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Version output is null");
    }
    return guard_string(resolve_api(api).version(), MAX_INFO_LEN, Utf8Policy::Lossy, out);
}

wsf_result_t engine_system_info(std::string* out, const NativeApi* api) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "System info output is null");
    }
    return guard_string(resolve_api(api).print_system_info(), MAX_INFO_LEN, Utf8Policy::Lossy,
                        out);
}

}  // namespace whispersafe
