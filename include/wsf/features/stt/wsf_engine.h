/**
 * @file wsf_engine.h
 * @brief whisper-safe - Engine-wide Queries
 *
 * Language table and build information. These do not need a loaded model.
 */

#ifndef WSF_ENGINE_H
#define WSF_ENGINE_H

#include <string>

#include "wsf/core/wsf_config.h"
#include "wsf/core/wsf_error.h"
#include "wsf/ffi/wsf_native_api.h"

namespace whispersafe {

/** Largest valid language id */
int lang_max_id(const NativeApi* api = nullptr);

/**
 * Language id for a code ("en") or full name ("english").
 *
 * @return WSF_SUCCESS or WSF_ERROR_INVALID_ARGUMENT for an unknown language
 */
wsf_result_t lang_id(const std::string& lang, int* out, const NativeApi* api = nullptr);

/**
 * Short code for a language id, e.g. "de".
 *
 * The name is read through the string guard bounded by
 * limits->max_language_len, or the GuardLimits default when limits is null.
 */
wsf_result_t lang_str(int id, std::string* out, const NativeApi* api = nullptr,
                      const GuardLimits* limits = nullptr);

/** Full name for a language id, e.g. "german" */
wsf_result_t lang_str_full(int id, std::string* out, const NativeApi* api = nullptr,
                           const GuardLimits* limits = nullptr);

wsf_result_t engine_version(std::string* out, const NativeApi* api = nullptr);

/** Compiled-in backend features (AVX, Metal, CUDA, ...) */
wsf_result_t engine_system_info(std::string* out, const NativeApi* api = nullptr);

}  // namespace whispersafe

#endif  // WSF_ENGINE_H
