/**
 * @file wsf_context.h
 * @brief whisper-safe - Loaded Model
 *
 * A WhisperContext owns a whisper_context and is only handed out as a
 * shared_ptr. Every WhisperState created from it holds a reference, so
 * the model is freed only after its last state.
 */

#ifndef WSF_CONTEXT_H
#define WSF_CONTEXT_H

#include <nlohmann/json.hpp>
#include <whisper.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "wsf/core/wsf_config.h"
#include "wsf/core/wsf_error.h"
#include "wsf/core/wsf_types.h"
#include "wsf/ffi/wsf_native_api.h"

namespace whispersafe {

class WhisperState;

// =============================================================================
// CONTEXT PARAMETERS
// =============================================================================

struct ContextParams {
    bool use_gpu = true;
    bool flash_attn = false;
    int gpu_device = 0;
    GuardLimits limits;

    /** Keys: use_gpu, flash_attn, gpu_device, limits (object, see GuardLimits) */
    static wsf_result_t from_json(const nlohmann::json& config, ContextParams* out);

    whisper_context_params to_native() const;
};

// =============================================================================
// WHISPER CONTEXT
// =============================================================================

class WhisperContext : public std::enable_shared_from_this<WhisperContext> {
   public:
    /**
     * Load a model from a file.
     *
     * @return WSF_SUCCESS, WSF_ERROR_INVALID_ARGUMENT or WSF_ERROR_MODEL_LOAD_FAILED
     */
    static wsf_result_t create_from_file(const std::string& path, const ContextParams& params,
                                         std::shared_ptr<WhisperContext>* out,
                                         const NativeApi* api = nullptr);

    /**
     * Load a model from memory. The engine reads the buffer during this call
     * only; it may be released afterwards.
     */
    static wsf_result_t create_from_buffer(const void* data, size_t size,
                                           const ContextParams& params,
                                           std::shared_ptr<WhisperContext>* out,
                                           const NativeApi* api = nullptr);

    ~WhisperContext();

    WhisperContext(const WhisperContext&) = delete;
    WhisperContext& operator=(const WhisperContext&) = delete;

    /**
     * Create a decode state. The state keeps this context alive.
     *
     * @return WSF_SUCCESS or WSF_ERROR_STATE_INIT_FAILED
     */
    wsf_result_t create_state(std::unique_ptr<WhisperState>* out) const;

    /**
     * Convert text to token ids, allowing at most max_tokens.
     *
     * @return WSF_SUCCESS, WSF_ERROR_INVALID_ARGUMENT (interior NUL),
     *         WSF_ERROR_TOKENIZE_FAILED (detail "required_tokens" when the
     *         engine reports how many would be needed) or
     *         WSF_ERROR_BUFFER_OVERFLOW
     */
    wsf_result_t tokenize(const std::string& text, size_t max_tokens,
                          std::vector<wsf_token_id_t>* out) const;

    int n_vocab() const;
    bool is_multilingual() const;

    // Token id to text; ids outside [0, n_vocab) fail with WSF_ERROR_INDEX_OUT_OF_BOUNDS
    wsf_result_t token_to_bytes(wsf_token_id_t token, std::vector<uint8_t>* out) const;
    wsf_result_t token_to_str(wsf_token_id_t token, std::string* out) const;
    wsf_result_t token_to_str_lossy(wsf_token_id_t token, std::string* out) const;

    const GuardLimits& limits() const { return limits_; }
    const NativeApi& api() const { return *api_; }
    whisper_context* native_handle() const { return ctx_; }

   private:
    WhisperContext(whisper_context* ctx, const ContextParams& params, const NativeApi* api);

    wsf_result_t token_text_ptr(wsf_token_id_t token, const char** out) const;

    const NativeApi* api_;
    whisper_context* ctx_;
    GuardLimits limits_;
};

}  // namespace whispersafe

#endif  // WSF_CONTEXT_H
