/**
 * @file wsf_config.cpp
 * @brief whisper-safe - JSON Configuration Helpers Implementation
 */

#include "wsf/core/wsf_config.h"

#include <limits>

#include "wsf/core/wsf_structured_error.h"

namespace whispersafe {

namespace config {

static wsf_result_t type_error(const char* key, const char* expected) {
    wsf_set_errorf(WSF_ERROR_INVALID_CONFIG, "Config key '%s' must be %s", key, expected);
    wsf_last_error_set_detail(0, "key", key);
    return WSF_ERROR_INVALID_CONFIG;
}

wsf_result_t require_object(const nlohmann::json& config, const char* what) {
    if (config.is_null() || config.is_object()) {
        return WSF_SUCCESS;
    }
    return wsf_set_errorf(WSF_ERROR_INVALID_CONFIG, "%s config must be a JSON object", what);
}

wsf_result_t read_bool(const nlohmann::json& config, const char* key, bool* out) {
    if (!config.contains(key)) return WSF_SUCCESS;
    const auto& value = config[key];
    if (!value.is_boolean()) {
        return type_error(key, "a boolean");
    }
    *out = value.get<bool>();
    return WSF_SUCCESS;
}

wsf_result_t read_int(const nlohmann::json& config, const char* key, int min_value,
                      int max_value, int* out) {
    if (!config.contains(key)) return WSF_SUCCESS;
    const auto& value = config[key];
    if (!value.is_number_integer()) {
        return type_error(key, "an integer");
    }
    const int64_t v = value.get<int64_t>();
    if (v < min_value || v > max_value) {
        wsf_set_errorf(WSF_ERROR_INVALID_CONFIG, "Config key '%s' out of range [%d, %d]", key,
                       min_value, max_value);
        wsf_last_error_set_detail(0, "key", key);
        return WSF_ERROR_INVALID_CONFIG;
    }
    *out = static_cast<int>(v);
    return WSF_SUCCESS;
}

wsf_result_t read_size(const nlohmann::json& config, const char* key, size_t min_value,
                       size_t* out) {
    if (!config.contains(key)) return WSF_SUCCESS;
    const auto& value = config[key];
    if (!value.is_number_integer()) {
        return type_error(key, "an integer");
    }
    if (value.is_number_unsigned()) {
        const uint64_t v = value.get<uint64_t>();
        if (v >= min_value && v <= std::numeric_limits<size_t>::max()) {
            *out = static_cast<size_t>(v);
            return WSF_SUCCESS;
        }
    } else {
        const int64_t v = value.get<int64_t>();
        if (v >= 0 && static_cast<uint64_t>(v) >= min_value) {
            *out = static_cast<size_t>(v);
            return WSF_SUCCESS;
        }
    }
    wsf_set_errorf(WSF_ERROR_INVALID_CONFIG, "Config key '%s' must be at least %zu", key,
                   min_value);
    wsf_last_error_set_detail(0, "key", key);
    return WSF_ERROR_INVALID_CONFIG;
}

wsf_result_t read_float(const nlohmann::json& config, const char* key, float min_value,
                        float max_value, float* out) {
    if (!config.contains(key)) return WSF_SUCCESS;
    const auto& value = config[key];
    if (!value.is_number()) {
        return type_error(key, "a number");
    }
    const double v = value.get<double>();
    if (v < min_value || v > max_value) {
        wsf_set_errorf(WSF_ERROR_INVALID_CONFIG, "Config key '%s' out of range [%g, %g]", key,
                       static_cast<double>(min_value), static_cast<double>(max_value));
        wsf_last_error_set_detail(0, "key", key);
        return WSF_ERROR_INVALID_CONFIG;
    }
    *out = static_cast<float>(v);
    return WSF_SUCCESS;
}

wsf_result_t read_string(const nlohmann::json& config, const char* key, std::string* out) {
    if (!config.contains(key)) return WSF_SUCCESS;
    const auto& value = config[key];
    if (!value.is_string()) {
        return type_error(key, "a string");
    }
    *out = value.get<std::string>();
    return WSF_SUCCESS;
}

}  // namespace config

wsf_result_t GuardLimits::from_json(const nlohmann::json& json, GuardLimits* out) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "GuardLimits output is null");
    }
    wsf_result_t rc = config::require_object(json, "limits");
    if (rc != WSF_SUCCESS) return rc;

    GuardLimits limits = *out;
    if ((rc = config::read_size(json, "max_token_text_len", 1, &limits.max_token_text_len)) !=
            WSF_SUCCESS ||
        (rc = config::read_size(json, "max_segment_text_len", 1,
                                &limits.max_segment_text_len)) != WSF_SUCCESS ||
        (rc = config::read_size(json, "max_language_len", 1, &limits.max_language_len)) !=
            WSF_SUCCESS ||
        (rc = config::read_size(json, "max_vocab_text_len", 1, &limits.max_vocab_text_len)) !=
            WSF_SUCCESS) {
        return rc;
    }

    *out = limits;
    return WSF_SUCCESS;
}

}  // namespace whispersafe
