#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#if defined(__x86_64__) || defined(_M_X64)
#include <immintrin.h>
#ifndef SPANX_HAS_SSE2
#define SPANX_HAS_SSE2
#endif
#ifdef __AVX2__
#ifndef SPANX_HAS_AVX2
#define SPANX_HAS_AVX2
#endif
#endif
#endif

// Delimiter search over raw bytes. All functions return the offset of the
// first match relative to `data`, or `npos` when there is none.
namespace spanx::scan {

inline constexpr size_t npos = static_cast<size_t>(-1);

inline size_t find_crlf_scalar(const uint8_t* data, size_t len) noexcept {
    if (len < 2) {
        return npos;
    }
    for (size_t i = 0; i + 1 < len; ++i) {
        if (data[i] == '\r' && data[i + 1] == '\n') {
            return i;
        }
    }
    return npos;
}

#ifdef SPANX_HAS_AVX2
inline size_t find_crlf_avx2(const uint8_t* data, size_t len) noexcept {
    if (len < 2) {
        return npos;
    }

    const __m256i cr = _mm256_set1_epi8('\r');
    const __m256i lf = _mm256_set1_epi8('\n');

    size_t i = 0;
    for (; i + 33 <= len; i += 32) {
        __m256i chunk = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(data + i));
        __m256i next_chunk = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(data + i + 1));

        __m256i crlf_match =
            _mm256_and_si256(_mm256_cmpeq_epi8(chunk, cr), _mm256_cmpeq_epi8(next_chunk, lf));
        const auto mask_bits = static_cast<unsigned int>(_mm256_movemask_epi8(crlf_match));

        if (mask_bits != 0U) {
            return i + static_cast<size_t>(__builtin_ctz(mask_bits));
        }
    }

    size_t tail = find_crlf_scalar(data + i, len - i);
    return tail == npos ? npos : i + tail;
}
#endif

#ifdef SPANX_HAS_SSE2
inline size_t find_crlf_sse2(const uint8_t* data, size_t len) noexcept {
    if (len < 2) {
        return npos;
    }

    const __m128i cr = _mm_set1_epi8('\r');
    const __m128i lf = _mm_set1_epi8('\n');

    size_t i = 0;
    for (; i + 17 <= len; i += 16) {
        __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(data + i));
        __m128i next_chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(data + i + 1));

        __m128i crlf_match =
            _mm_and_si128(_mm_cmpeq_epi8(chunk, cr), _mm_cmpeq_epi8(next_chunk, lf));
        const auto mask_bits = static_cast<unsigned int>(_mm_movemask_epi8(crlf_match));

        if (mask_bits != 0U) {
            return i + static_cast<size_t>(__builtin_ctz(mask_bits));
        }
    }

    size_t tail = find_crlf_scalar(data + i, len - i);
    return tail == npos ? npos : i + tail;
}
#endif

inline size_t find_crlf(const uint8_t* data, size_t len) noexcept {
#ifdef SPANX_HAS_AVX2
    return find_crlf_avx2(data, len);
#elif defined(SPANX_HAS_SSE2)
    return find_crlf_sse2(data, len);
#else
    return find_crlf_scalar(data, len);
#endif
}

inline size_t find_byte(const uint8_t* data, size_t len, uint8_t needle) noexcept {
    if (len == 0) {
        return npos;
    }
    const void* hit = std::memchr(data, needle, len);
    return hit ? static_cast<size_t>(static_cast<const uint8_t*>(hit) - data) : npos;
}

inline size_t
find_pattern(const uint8_t* haystack, size_t hlen, const uint8_t* needle, size_t nlen) noexcept {
    if (nlen == 0) {
        return 0;
    }
    if (hlen < nlen) {
        return npos;
    }
    if (nlen == 1) {
        return find_byte(haystack, hlen, needle[0]);
    }
    if (nlen == 2 && needle[0] == '\r' && needle[1] == '\n') {
        return find_crlf(haystack, hlen);
    }

#ifdef __linux__
    const void* hit = memmem(haystack, hlen, needle, nlen);
    return hit ? static_cast<size_t>(static_cast<const uint8_t*>(hit) - haystack) : npos;
#else
    for (size_t i = 0; i + nlen <= hlen; ++i) {
        if (std::memcmp(haystack + i, needle, nlen) == 0) {
            return i;
        }
    }
    return npos;
#endif
}

} // namespace spanx::scan
