/**
 * @file wsf_config.h
 * @brief whisper-safe - JSON Configuration Helpers
 *
 * Every configurable type exposes a from_json() (or apply_json()) taking a
 * nlohmann::json object. Readers only touch keys that are present; a key with
 * the wrong type or an out-of-range value fails with WSF_ERROR_INVALID_CONFIG.
 */

#ifndef WSF_CONFIG_H
#define WSF_CONFIG_H

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

#include "wsf/core/wsf_error.h"

namespace whispersafe {

// =============================================================================
// GUARD LIMITS
// =============================================================================

/**
 * Upper bounds, in bytes including the terminator, for scanning C strings
 * returned by the engine.
 */
struct GuardLimits {
    size_t max_token_text_len = 1024;
    size_t max_segment_text_len = 65536;
    size_t max_language_len = 64;
    size_t max_vocab_text_len = 1024;

    /**
     * Keys: max_token_text_len, max_segment_text_len, max_language_len,
     * max_vocab_text_len. All must be positive integers.
     */
    static wsf_result_t from_json(const nlohmann::json& config, GuardLimits* out);
};

// =============================================================================
// FIELD READERS
// =============================================================================

namespace config {

wsf_result_t read_bool(const nlohmann::json& config, const char* key, bool* out);
wsf_result_t read_int(const nlohmann::json& config, const char* key, int min_value,
                      int max_value, int* out);
wsf_result_t read_size(const nlohmann::json& config, const char* key, size_t min_value,
                       size_t* out);
wsf_result_t read_float(const nlohmann::json& config, const char* key, float min_value,
                        float max_value, float* out);
wsf_result_t read_string(const nlohmann::json& config, const char* key, std::string* out);

// Fails unless config is a JSON object (null counts as an empty object)
wsf_result_t require_object(const nlohmann::json& config, const char* what);

}  // namespace config

}  // namespace whispersafe

#endif  // WSF_CONFIG_H
