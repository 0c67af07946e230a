/**
 * @file wsf_cstring_guard.h
 * @brief whisper-safe - C String Extraction Guard
 *
 * Every C string the engine hands back goes through here before a host
 * string is built from it. The pointer is checked for null and scanned
 * byte-by-byte for a terminator within a fixed bound, so a missing or
 * corrupted terminator can never cause an unbounded read.
 */

#ifndef WSF_CSTRING_GUARD_H
#define WSF_CSTRING_GUARD_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "wsf/core/wsf_error.h"

namespace whispersafe {

/**
 * Borrowed view of a validated C string. `data[length]` is the terminator.
 * Only valid until the engine next invalidates the memory it came from.
 */
struct BoundedCStr {
    const char* data = nullptr;
    size_t length = 0;
};

enum class Utf8Policy {
    Strict,  // invalid UTF-8 fails with WSF_ERROR_INVALID_UTF8
    Lossy    // invalid sequences become U+FFFD
};

/**
 * Validate a native C string.
 *
 * Reads at most max_len bytes. The terminator must be found within those
 * bytes, so the longest accepted string is max_len - 1 characters.
 *
 * @return WSF_SUCCESS, WSF_ERROR_NULL_POINTER or WSF_ERROR_INVALID_STRING.
 *         A null out gives WSF_ERROR_INVALID_ARGUMENT. *out is written only
 *         on success.
 */
wsf_result_t guard_cstr(const char* ptr, size_t max_len, BoundedCStr* out);

/**
 * Guard plus UTF-8 handling, producing an owned host string.
 */
wsf_result_t guard_string(const char* ptr, size_t max_len, Utf8Policy policy, std::string* out);

/**
 * Guard producing the raw bytes, without the terminator and without any
 * UTF-8 check. Token pieces may be partial multi-byte sequences.
 */
wsf_result_t guard_bytes(const char* ptr, size_t max_len, std::vector<uint8_t>* out);

// =============================================================================
// UTF-8
// =============================================================================

/**
 * Well-formed UTF-8 check. Rejects overlong encodings, surrogates and code
 * points above U+10FFFF.
 */
bool is_valid_utf8(const char* data, size_t length);

/**
 * Copy with each maximal ill-formed subsequence replaced by U+FFFD.
 */
std::string utf8_lossy(const char* data, size_t length);

}  // namespace whispersafe

#endif  // WSF_CSTRING_GUARD_H
