/**
 * @file wsf_vad.cpp
 * @brief whisper-safe - Voice Activity Detection Session Implementation
 */

#include "wsf/features/vad/wsf_vad.h"

#include <climits>
#include <cstring>

#include "wsf/core/wsf_config.h"
#include "wsf/core/wsf_logger.h"
#include "wsf/core/wsf_structured_error.h"

namespace whispersafe {

static const char* LOG_CAT = "VAD";

// =============================================================================
// PARAMETERS
// =============================================================================

wsf_result_t VadContextParams::from_json(const nlohmann::json& json, VadContextParams* out) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "VadContextParams output is null");
    }
    wsf_result_t rc = config::require_object(json, "vad context");
    if (rc != WSF_SUCCESS) return rc;

    VadContextParams params = *out;
    if ((rc = config::read_int(json, "n_threads", 1, 256, &params.n_threads)) != WSF_SUCCESS ||
        (rc = config::read_bool(json, "use_gpu", &params.use_gpu)) != WSF_SUCCESS ||
        (rc = config::read_int(json, "gpu_device", 0, INT_MAX, &params.gpu_device)) !=
            WSF_SUCCESS) {
        return rc;
    }
    *out = params;
    return WSF_SUCCESS;
}

whisper_vad_context_params VadContextParams::to_native() const {
    whisper_vad_context_params native = whisper_vad_default_context_params();
    native.n_threads = n_threads;
    native.use_gpu = use_gpu;
    native.gpu_device = gpu_device;
    return native;
}

wsf_result_t VadParams::from_json(const nlohmann::json& json, VadParams* out) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "VadParams output is null");
    }
    wsf_result_t rc = config::require_object(json, "vad");
    if (rc != WSF_SUCCESS) return rc;

    VadParams params = *out;
    if ((rc = config::read_float(json, "threshold", 0.0f, 1.0f, &params.threshold)) !=
            WSF_SUCCESS ||
        (rc = config::read_int(json, "min_speech_duration_ms", 0, INT_MAX,
                               &params.min_speech_duration_ms)) != WSF_SUCCESS ||
        (rc = config::read_int(json, "min_silence_duration_ms", 0, INT_MAX,
                               &params.min_silence_duration_ms)) != WSF_SUCCESS ||
        (rc = config::read_float(json, "max_speech_duration_s", 0.0f, FLT_MAX,
                                 &params.max_speech_duration_s)) != WSF_SUCCESS ||
        (rc = config::read_int(json, "speech_pad_ms", 0, INT_MAX, &params.speech_pad_ms)) !=
            WSF_SUCCESS ||
        (rc = config::read_float(json, "samples_overlap", 0.0f, FLT_MAX,
                                 &params.samples_overlap)) != WSF_SUCCESS) {
        return rc;
    }
    *out = params;
    return WSF_SUCCESS;
}

VadParams VadParams::from_native(const whisper_vad_params& native) {
    VadParams params;
    params.threshold = native.threshold;
    params.min_speech_duration_ms = native.min_speech_duration_ms;
    params.min_silence_duration_ms = native.min_silence_duration_ms;
    params.max_speech_duration_s = native.max_speech_duration_s;
    params.speech_pad_ms = native.speech_pad_ms;
    params.samples_overlap = native.samples_overlap;
    return params;
}

whisper_vad_params VadParams::to_native() const {
    whisper_vad_params native = whisper_vad_default_params();
    native.threshold = threshold;
    native.min_speech_duration_ms = min_speech_duration_ms;
    native.min_silence_duration_ms = min_silence_duration_ms;
    native.max_speech_duration_s = max_speech_duration_s;
    native.speech_pad_ms = speech_pad_ms;
    native.samples_overlap = samples_overlap;
    return native;
}

// =============================================================================
// VAD CONTEXT
// =============================================================================

namespace {

// Frees the engine's segment list on every exit path
struct SegmentsDeleter {
    const NativeApi* api;
    void operator()(whisper_vad_segments* segments) const {
        if (segments) api->vad_free_segments(segments);
    }
};

using SegmentsPtr = std::unique_ptr<whisper_vad_segments, SegmentsDeleter>;

wsf_result_t check_samples(const float* samples, size_t n_samples) {
    if (!samples && n_samples > 0) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Sample buffer is null");
    }
    if (n_samples > static_cast<size_t>(INT_MAX)) {
        return wsf_set_errorf(WSF_ERROR_INVALID_ARGUMENT, "Too many samples: %zu", n_samples);
    }
    return WSF_SUCCESS;
}

}  // namespace

wsf_result_t VadContext::create(const std::string& model_path, const VadContextParams& params,
                                std::unique_ptr<VadContext>* out, const NativeApi* api) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "VadContext output is null");
    }
    if (model_path.empty() || model_path.find('\0') != std::string::npos) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Invalid VAD model path");
    }

    const NativeApi& native = resolve_api(api);

    // The path handed to the engine is the one the context keeps, so the
    // pointer stays valid for the whole life of the handle
    std::unique_ptr<VadContext> vad(new VadContext(model_path, &native));
    vad->vctx_ = native.vad_init_from_file(vad->model_path_.c_str(), params.to_native());
    if (!vad->vctx_) {
        wsf_set_errorf(WSF_ERROR_MODEL_LOAD_FAILED, "Failed to load VAD model: %s",
                       model_path.c_str());
        wsf_last_error_set_detail(0, "path", model_path.c_str());
        return WSF_ERROR_MODEL_LOAD_FAILED;
    }

    *out = std::move(vad);
    WSF_LOG_INFO(LOG_CAT, "VAD model loaded: %s", (*out)->model_path_.c_str());
    return WSF_SUCCESS;
}

VadContext::VadContext(std::string model_path, const NativeApi* api)
    : api_(api), vctx_(nullptr), model_path_(std::move(model_path)) {}

VadContext::~VadContext() {
    if (vctx_) {
        api_->vad_free(vctx_);
        vctx_ = nullptr;
    }
}

wsf_result_t VadContext::detect_speech(const float* samples, size_t n_samples) {
    wsf_result_t rc = check_samples(samples, n_samples);
    if (rc != WSF_SUCCESS) return rc;

    if (!api_->vad_detect_speech(vctx_, samples, static_cast<int>(n_samples))) {
        return WSF_SET_ERROR(WSF_ERROR_VAD_FAILED, "Speech detection failed");
    }
    return WSF_SUCCESS;
}

wsf_result_t VadContext::probs(std::vector<float>* out) const {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Probability output is null");
    }

    const int n_probs = api_->vad_n_probs(vctx_);
    if (n_probs < 0) {
        wsf_set_errorf(WSF_ERROR_VAD_FAILED, "Engine reported %d probabilities", n_probs);
        wsf_last_error_set_native_code(n_probs);
        return WSF_ERROR_VAD_FAILED;
    }
    if (n_probs == 0) {
        out->clear();
        return WSF_SUCCESS;
    }

    const float* probs = api_->vad_probs(vctx_);
    if (!probs) {
        return WSF_SET_ERROR(WSF_ERROR_NULL_POINTER, "Engine returned a null probability table");
    }

    out->assign(probs, probs + n_probs);
    return WSF_SUCCESS;
}

wsf_result_t VadContext::collect_segments(whisper_vad_segments* raw,
                                          std::vector<VadSegment>* out) const {
    SegmentsPtr segments(raw, SegmentsDeleter{api_});
    if (!segments) {
        return WSF_SET_ERROR(WSF_ERROR_VAD_FAILED, "Engine returned no segment list");
    }

    const int n_segments = api_->vad_segments_n_segments(segments.get());
    if (n_segments < 0) {
        wsf_set_errorf(WSF_ERROR_VAD_FAILED, "Engine reported %d segments", n_segments);
        wsf_last_error_set_native_code(n_segments);
        return WSF_ERROR_VAD_FAILED;
    }

    std::vector<VadSegment> result;
    result.reserve(static_cast<size_t>(n_segments));
    for (int i = 0; i < n_segments; ++i) {
        VadSegment segment;
        segment.start = api_->vad_segment_t0(segments.get(), i);
        segment.end = api_->vad_segment_t1(segments.get(), i);
        result.push_back(segment);
    }

    WSF_LOG_DEBUG(LOG_CAT, "Detected %d speech segments", n_segments);
    *out = std::move(result);
    return WSF_SUCCESS;
}

wsf_result_t VadContext::segments_from_probs(const VadParams& params,
                                             std::vector<VadSegment>* out) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Segment output is null");
    }
    return collect_segments(api_->vad_segments_from_probs(vctx_, params.to_native()), out);
}

wsf_result_t VadContext::segments_from_samples(const VadParams& params, const float* samples,
                                               size_t n_samples, std::vector<VadSegment>* out) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Segment output is null");
    }
    wsf_result_t rc = check_samples(samples, n_samples);
    if (rc != WSF_SUCCESS) return rc;

    return collect_segments(api_->vad_segments_from_samples(vctx_, params.to_native(), samples,
                                                            static_cast<int>(n_samples)),
                            out);
}

}  // namespace whispersafe
