/**
 * @file wsf_context.cpp
 * @brief whisper-safe - Loaded Model Implementation
 */

#include "wsf/features/stt/wsf_context.h"

#include <climits>

#include "wsf/core/wsf_logger.h"
#include "wsf/core/wsf_structured_error.h"
#include "wsf/features/stt/wsf_state.h"
#include "wsf/ffi/wsf_buffer_fill.h"
#include "wsf/ffi/wsf_cstring_guard.h"

namespace whispersafe {

static const char* LOG_CAT = "STT.Context";

// =============================================================================
// CONTEXT PARAMETERS
// =============================================================================

wsf_result_t ContextParams::from_json(const nlohmann::json& json, ContextParams* out) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "ContextParams output is null");
    }
    wsf_result_t rc = config::require_object(json, "context");
    if (rc != WSF_SUCCESS) return rc;

    ContextParams params = *out;
    if ((rc = config::read_bool(json, "use_gpu", &params.use_gpu)) != WSF_SUCCESS ||
        (rc = config::read_bool(json, "flash_attn", &params.flash_attn)) != WSF_SUCCESS ||
        (rc = config::read_int(json, "gpu_device", 0, INT_MAX, &params.gpu_device)) !=
            WSF_SUCCESS) {
        return rc;
    }
    if (json.contains("limits")) {
        if ((rc = GuardLimits::from_json(json["limits"], &params.limits)) != WSF_SUCCESS) {
            return rc;
        }
    }

    *out = params;
    return WSF_SUCCESS;
}

whisper_context_params ContextParams::to_native() const {
    whisper_context_params native = whisper_context_default_params();
    native.use_gpu = use_gpu;
    native.flash_attn = flash_attn;
    native.gpu_device = gpu_device;
    return native;
}

// =============================================================================
// LIFECYCLE
// =============================================================================

WhisperContext::WhisperContext(whisper_context* ctx, const ContextParams& params,
                               const NativeApi* api)
    : api_(api), ctx_(ctx), limits_(params.limits) {}

WhisperContext::~WhisperContext() {
    if (ctx_) {
        api_->free_context(ctx_);
        ctx_ = nullptr;
    }
    WSF_LOG_DEBUG(LOG_CAT, "Model freed");
}

wsf_result_t WhisperContext::create_from_file(const std::string& path,
                                              const ContextParams& params,
                                              std::shared_ptr<WhisperContext>* out,
                                              const NativeApi* api) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Context output is null");
    }
    if (path.empty() || path.find('\0') != std::string::npos) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Invalid model path");
    }

    const NativeApi& native = resolve_api(api);
    whisper_context* ctx = native.init_from_file(path.c_str(), params.to_native());
    if (!ctx) {
        wsf_set_errorf(WSF_ERROR_MODEL_LOAD_FAILED, "Failed to load model: %s", path.c_str());
        wsf_last_error_set_detail(0, "path", path.c_str());
        return WSF_ERROR_MODEL_LOAD_FAILED;
    }

    out->reset(new WhisperContext(ctx, params, &native));
    WSF_LOG_INFO(LOG_CAT, "Model loaded: %s (gpu=%d)", path.c_str(), params.use_gpu ? 1 : 0);
    return WSF_SUCCESS;
}

wsf_result_t WhisperContext::create_from_buffer(const void* data, size_t size,
                                                const ContextParams& params,
                                                std::shared_ptr<WhisperContext>* out,
                                                const NativeApi* api) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Context output is null");
    }
    if (!data || size == 0) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Model buffer is empty");
    }

    const NativeApi& native = resolve_api(api);
    // The engine's loader only reads from the buffer
    whisper_context* ctx =
        native.init_from_buffer(const_cast<void*>(data), size, params.to_native());
    if (!ctx) {
        wsf_set_errorf(WSF_ERROR_MODEL_LOAD_FAILED, "Failed to load model from %zu-byte buffer",
                       size);
        wsf_last_error_set_detail_int(0, "size", static_cast<int64_t>(size));
        return WSF_ERROR_MODEL_LOAD_FAILED;
    }

    out->reset(new WhisperContext(ctx, params, &native));
    WSF_LOG_INFO(LOG_CAT, "Model loaded from buffer (%zu bytes)", size);
    return WSF_SUCCESS;
}

wsf_result_t WhisperContext::create_state(std::unique_ptr<WhisperState>* out) const {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "State output is null");
    }

    whisper_state* state = api_->init_state(ctx_);
    if (!state) {
        return WSF_SET_ERROR(WSF_ERROR_STATE_INIT_FAILED, "Failed to create decode state");
    }

    out->reset(new WhisperState(shared_from_this(), state));
    return WSF_SUCCESS;
}

// =============================================================================
// VOCABULARY
// =============================================================================

wsf_result_t WhisperContext::tokenize(const std::string& text, size_t max_tokens,
                                      std::vector<wsf_token_id_t>* out) const {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Token output is null");
    }
    if (text.find('\0') != std::string::npos) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Text contains an interior NUL");
    }

    int native_count = 0;
    wsf_result_t rc = fill_buffer<whisper_token>(
        max_tokens, WSF_ERROR_TOKENIZE_FAILED,
        [this, &text](whisper_token* buffer, int capacity) {
            return api_->tokenize(ctx_, text.c_str(), buffer, capacity);
        },
        out, &native_count);

    if (rc == WSF_ERROR_TOKENIZE_FAILED) {
        // The engine returns the negated number of tokens it needed
        wsf_last_error_set_detail_int(1, "required_tokens", -static_cast<int64_t>(native_count));
        wsf_last_error_set_detail_int(2, "max_tokens", static_cast<int64_t>(max_tokens));
    }
    return rc;
}

int WhisperContext::n_vocab() const {
    return api_->n_vocab(ctx_);
}

bool WhisperContext::is_multilingual() const {
    return api_->is_multilingual(ctx_) != 0;
}

wsf_result_t WhisperContext::token_text_ptr(wsf_token_id_t token, const char** out) const {
    const int vocab = n_vocab();
    if (token < 0 || token >= vocab) {
        wsf_set_errorf(WSF_ERROR_INDEX_OUT_OF_BOUNDS, "Token id %d outside vocabulary of %d",
                       token, vocab);
        wsf_last_error_set_detail_int(0, "token", token);
        wsf_last_error_set_detail_int(1, "n_vocab", vocab);
        return WSF_ERROR_INDEX_OUT_OF_BOUNDS;
    }
    *out = api_->token_to_str(ctx_, token);
    return WSF_SUCCESS;
}

wsf_result_t WhisperContext::token_to_bytes(wsf_token_id_t token,
                                            std::vector<uint8_t>* out) const {
    const char* raw = nullptr;
    wsf_result_t rc = token_text_ptr(token, &raw);
    if (rc != WSF_SUCCESS) return rc;
    return guard_bytes(raw, limits_.max_vocab_text_len, out);
}

wsf_result_t WhisperContext::token_to_str(wsf_token_id_t token, std::string* out) const {
    const char* raw = nullptr;
    wsf_result_t rc = token_text_ptr(token, &raw);
    if (rc != WSF_SUCCESS) return rc;
    return guard_string(raw, limits_.max_vocab_text_len, Utf8Policy::Strict, out);
}

wsf_result_t WhisperContext::token_to_str_lossy(wsf_token_id_t token, std::string* out) const {
    const char* raw = nullptr;
    wsf_result_t rc = token_text_ptr(token, &raw);
    if (rc != WSF_SUCCESS) return rc;
    return guard_string(raw, limits_.max_vocab_text_len, Utf8Policy::Lossy, out);
}

}  // namespace whispersafe
