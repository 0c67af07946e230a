/**
 * @file wsf_cstring_guard.cpp
 * @brief whisper-safe - C String Extraction Guard Implementation
 */

#include "wsf/ffi/wsf_cstring_guard.h"

#include "wsf/core/wsf_logger.h"
#include "wsf/core/wsf_structured_error.h"

namespace whispersafe {

static const char* LOG_CAT = "FFI.Guard";

// =============================================================================
// UTF-8 DECODING
// =============================================================================

/**
 * Length of the well-formed sequence starting at bytes[0], or 0 if it is
 * ill-formed. On 0, *invalid_len receives the length of the maximal
 * ill-formed subpart (always >= 1).
 */
static size_t utf8_sequence_length(const unsigned char* bytes, size_t remaining,
                                   size_t* invalid_len) {
    const unsigned char lead = bytes[0];
    if (lead < 0x80) {
        return 1;
    }

    size_t need;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 2;
    } else if (lead == 0xE0) {
        need = 3;
        lo = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        need = 3;
    } else if (lead == 0xED) {
        need = 3;
        hi = 0x9F;
    } else if (lead == 0xF0) {
        need = 4;
        lo = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        need = 4;
    } else if (lead == 0xF4) {
        need = 4;
        hi = 0x8F;
    } else {
        *invalid_len = 1;
        return 0;
    }

    for (size_t i = 1; i < need; ++i) {
        if (i >= remaining) {
            *invalid_len = i;
            return 0;
        }
        const unsigned char b = bytes[i];
        const unsigned char min = (i == 1) ? lo : 0x80;
        const unsigned char max = (i == 1) ? hi : 0xBF;
        if (b < min || b > max) {
            *invalid_len = i;
            return 0;
        }
    }
    return need;
}

bool is_valid_utf8(const char* data, size_t length) {
    if (!data) return length == 0;

    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(data);
    size_t pos = 0;
    while (pos < length) {
        size_t invalid_len = 0;
        const size_t n = utf8_sequence_length(bytes + pos, length - pos, &invalid_len);
        if (n == 0) {
            return false;
        }
        pos += n;
    }
    return true;
}

std::string utf8_lossy(const char* data, size_t length) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";

    std::string result;
    if (!data) return result;
    result.reserve(length);

    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(data);
    size_t pos = 0;
    while (pos < length) {
        size_t invalid_len = 0;
        const size_t n = utf8_sequence_length(bytes + pos, length - pos, &invalid_len);
        if (n == 0) {
            result.append(REPLACEMENT, 3);
            pos += invalid_len;
        } else {
            result.append(data + pos, n);
            pos += n;
        }
    }
    return result;
}

// =============================================================================
// GUARD
// =============================================================================

wsf_result_t guard_cstr(const char* ptr, size_t max_len, BoundedCStr* out) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "String view output is null");
    }
    if (!ptr) {
        return WSF_SET_ERROR(WSF_ERROR_NULL_POINTER, "Native string pointer is null");
    }

    // memchr/strnlen may read ahead of the terminator, so scan one byte at a time
    for (size_t i = 0; i < max_len; ++i) {
        if (ptr[i] == '\0') {
            out->data = ptr;
            out->length = i;
            return WSF_SUCCESS;
        }
    }

    wsf_set_errorf(WSF_ERROR_INVALID_STRING, "No terminator within %zu bytes", max_len);
    wsf_last_error_set_detail_int(0, "max_len", static_cast<int64_t>(max_len));
    return WSF_ERROR_INVALID_STRING;
}

wsf_result_t guard_string(const char* ptr, size_t max_len, Utf8Policy policy, std::string* out) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "String output is null");
    }
    BoundedCStr view;
    wsf_result_t rc = guard_cstr(ptr, max_len, &view);
    if (rc != WSF_SUCCESS) {
        return rc;
    }

    if (is_valid_utf8(view.data, view.length)) {
        out->assign(view.data, view.length);
        return WSF_SUCCESS;
    }

    if (policy == Utf8Policy::Lossy) {
        WSF_LOG_DEBUG(LOG_CAT, "Replacing invalid UTF-8 in %zu-byte string", view.length);
        *out = utf8_lossy(view.data, view.length);
        return WSF_SUCCESS;
    }

    return WSF_SET_ERROR(WSF_ERROR_INVALID_UTF8, "Native string is not valid UTF-8");
}

wsf_result_t guard_bytes(const char* ptr, size_t max_len, std::vector<uint8_t>* out) {
    if (!out) {
        return WSF_SET_ERROR(WSF_ERROR_INVALID_ARGUMENT, "Byte output is null");
    }
    BoundedCStr view;
    wsf_result_t rc = guard_cstr(ptr, max_len, &view);
    if (rc != WSF_SUCCESS) {
        return rc;
    }

    const uint8_t* begin = reinterpret_cast<const uint8_t*>(view.data);
    out->assign(begin, begin + view.length);
    return WSF_SUCCESS;
}

}  // namespace whispersafe
