/**
 * @file wsf_vad.h
 * @brief whisper-safe - Voice Activity Detection Session
 *
 * Owns a whisper.cpp VAD context. The model path is copied before being
 * handed to the engine and kept for as long as the handle lives.
 */

#ifndef WSF_VAD_H
#define WSF_VAD_H

#include <nlohmann/json.hpp>
#include <whisper.h>

#include <cfloat>
#include <memory>
#include <string>
#include <vector>

#include "wsf/core/wsf_error.h"
#include "wsf/ffi/wsf_native_api.h"

namespace whispersafe {

// =============================================================================
// PARAMETERS
// =============================================================================

struct VadContextParams {
    int n_threads = 4;
    bool use_gpu = false;
    int gpu_device = 0;

    /** Keys: n_threads, use_gpu, gpu_device */
    static wsf_result_t from_json(const nlohmann::json& config, VadContextParams* out);

    whisper_vad_context_params to_native() const;
};

/**
 * Segmentation parameters. Defaults match whisper_vad_default_params().
 */
struct VadParams {
    float threshold = 0.5f;
    int min_speech_duration_ms = 250;
    int min_silence_duration_ms = 100;
    float max_speech_duration_s = FLT_MAX;
    int speech_pad_ms = 30;
    float samples_overlap = 0.1f;

    /**
     * Keys: threshold (0..1), min_speech_duration_ms, min_silence_duration_ms,
     * max_speech_duration_s, speech_pad_ms, samples_overlap
     */
    static wsf_result_t from_json(const nlohmann::json& config, VadParams* out);

    static VadParams from_native(const whisper_vad_params& native);

    whisper_vad_params to_native() const;
};

/** Speech span, in the engine's segment time unit (centiseconds) */
struct VadSegment {
    float start = 0.0f;
    float end = 0.0f;
};

// =============================================================================
// VAD CONTEXT
// =============================================================================

class VadContext {
   public:
    /**
     * Load a VAD model.
     *
     * @return WSF_SUCCESS, WSF_ERROR_INVALID_ARGUMENT (empty path or interior NUL)
     *         or WSF_ERROR_MODEL_LOAD_FAILED
     */
    static wsf_result_t create(const std::string& model_path, const VadContextParams& params,
                               std::unique_ptr<VadContext>* out,
                               const NativeApi* api = nullptr);

    ~VadContext();

    VadContext(const VadContext&) = delete;
    VadContext& operator=(const VadContext&) = delete;

    /**
     * Run the model over a mono PCM buffer, computing per-frame speech
     * probabilities for probs() and segments_from_probs().
     */
    wsf_result_t detect_speech(const float* samples, size_t n_samples);

    /** Copy of the probability table from the last detect_speech() */
    wsf_result_t probs(std::vector<float>* out) const;

    wsf_result_t segments_from_probs(const VadParams& params, std::vector<VadSegment>* out);

    wsf_result_t segments_from_samples(const VadParams& params, const float* samples,
                                       size_t n_samples, std::vector<VadSegment>* out);

    const std::string& model_path() const { return model_path_; }

   private:
    VadContext(std::string model_path, const NativeApi* api);

    wsf_result_t collect_segments(whisper_vad_segments* segments,
                                  std::vector<VadSegment>* out) const;

    const NativeApi* api_;
    whisper_vad_context* vctx_;
    std::string model_path_;
};

}  // namespace whispersafe

#endif  // WSF_VAD_H
