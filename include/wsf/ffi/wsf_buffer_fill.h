/**
 * @file wsf_buffer_fill.h
 * @brief whisper-safe - Buffer-Fill Validator
 *
 * Wraps engine calls of the form `int fill(T* buffer, int capacity)` that
 * write into caller memory and return the number of elements written. The
 * returned count is never trusted: a negative count maps to a domain error
 * and a count above capacity is reported as WSF_ERROR_BUFFER_OVERFLOW
 * without exposing any element.
 *
 * Usage:
 *   std::vector<whisper_token> tokens;
 *   wsf_result_t rc = fill_buffer<whisper_token>(
 *       max_tokens, WSF_ERROR_TOKENIZE_FAILED,
 *       [&](whisper_token* buf, int cap) { return whisper_tokenize(ctx, text, buf, cap); },
 *       &tokens);
 */

#ifndef WSF_BUFFER_FILL_H
#define WSF_BUFFER_FILL_H

#include <climits>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "wsf/core/wsf_error.h"
#include "wsf/core/wsf_structured_error.h"

namespace whispersafe {

/**
 * @param capacity Number of elements the engine may write
 * @param negative_error Code returned when the engine reports a negative count
 * @param fill Callable `int(T* buffer, int capacity)`
 * @param out Receives exactly the validated count of elements; untouched on failure
 * @param native_count Optional, receives the raw engine return value on every path
 *        that reaches the engine
 */
template <typename T, typename Fill>
wsf_result_t fill_buffer(size_t capacity, wsf_result_t negative_error, Fill&& fill,
                         std::vector<T>* out, int* native_count = nullptr) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Buffer-fill output is null");
    }
    if (capacity > static_cast<size_t>(INT_MAX)) {
        wsf_set_errorf(WSF_ERROR_INVALID_ARGUMENT, "Buffer capacity %zu exceeds native limit",
                       capacity);
        wsf_last_error_set_detail_int(0, "capacity", static_cast<int64_t>(capacity));
        return WSF_ERROR_INVALID_ARGUMENT;
    }

    // Default-initialized; only the first `count` elements are ever read
    std::unique_ptr<T[]> buffer(new T[capacity > 0 ? capacity : 1]);

    const int count = fill(buffer.get(), static_cast<int>(capacity));
    if (native_count) {
        *native_count = count;
    }

    if (count < 0) {
        wsf_set_errorf(negative_error, "Native call reported failure (%d)", count);
        wsf_last_error_set_native_code(count);
        wsf_last_error_set_detail_int(0, "native_count", count);
        return negative_error;
    }
    if (static_cast<size_t>(count) > capacity) {
        wsf_set_errorf(WSF_ERROR_BUFFER_OVERFLOW,
                       "Native call reported %d elements for capacity %zu", count, capacity);
        wsf_last_error_set_detail_int(0, "capacity", static_cast<int64_t>(capacity));
        wsf_last_error_set_detail_int(1, "native_count", count);
        return WSF_ERROR_BUFFER_OVERFLOW;
    }

    out->assign(buffer.get(), buffer.get() + count);
    return WSF_SUCCESS;
}

}  // namespace whispersafe

#endif  // WSF_BUFFER_FILL_H
