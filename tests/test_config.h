#ifndef TEST_CONFIG_H
#define TEST_CONFIG_H

#include <cstdlib>
#include <string>
#include <sys/stat.h>

namespace test_config {

// =============================================================================
// File Utilities
// =============================================================================

inline bool file_exists(const std::string& path) {
    struct stat st;
    return (stat(path.c_str(), &st) == 0);
}

// =============================================================================
// Environment / Path Helpers
// =============================================================================

inline std::string get_env_path(const char* name) {
    const char* env = std::getenv(name);
    if (env && env[0] != '\0') return std::string(env);
    return "";
}

/** ggml Whisper model, e.g. ggml-tiny.en.bin */
inline std::string get_stt_model_path() {
    return get_env_path("WSF_TEST_MODEL");
}

/** ggml Silero VAD model, e.g. ggml-silero-v5.1.2.bin */
inline std::string get_vad_model_path() {
    return get_env_path("WSF_TEST_VAD_MODEL");
}

/** 16 kHz 16-bit WAV with speech (mono or stereo) */
inline std::string get_test_audio_path() {
    return get_env_path("WSF_TEST_AUDIO");
}

inline bool available(const std::string& path) {
    return !path.empty() && file_exists(path);
}

}  // namespace test_config

#endif  // TEST_CONFIG_H
