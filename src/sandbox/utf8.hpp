#pragma once

#include <cstddef>
#include <string_view>

namespace grader::utf8 {

/// Number of bytes a sequence starting with ``lead`` occupies. Invalid leads count as 1.
constexpr std::size_t sequence_length(unsigned char lead) {
    if ((lead & 0x80U) == 0) {
        return 1;
    }
    if ((lead & 0xE0U) == 0xC0U) {
        return 2;
    }
    if ((lead & 0xF0U) == 0xE0U) {
        return 3;
    }
    if ((lead & 0xF8U) == 0xF0U) {
        return 4;
    }
    return 1;
}

constexpr bool is_continuation(unsigned char byte) {
    return (byte & 0xC0U) == 0x80U;
}

/// Length of ``data`` without a trailing, incomplete multi-byte sequence
constexpr std::size_t complete_prefix_length(std::string_view data) {
    std::size_t lead_pos = data.size();

    // A sequence is at most 4 bytes, so its lead is at most 3 bytes before the end
    while (lead_pos > 0 && data.size() - lead_pos < 3 && is_continuation(static_cast<unsigned char>(data[lead_pos - 1]))) {
        --lead_pos;
    }

    if (lead_pos == 0) {
        return data.size();
    }

    --lead_pos;

    const std::size_t have = data.size() - lead_pos;
    const std::size_t need = sequence_length(static_cast<unsigned char>(data[lead_pos]));

    return have < need ? lead_pos : data.size();
}

static_assert(complete_prefix_length("abc") == 3);
static_assert(complete_prefix_length("a\xC3\xA9") == 3);
static_assert(complete_prefix_length("a\xC3") == 1);
static_assert(complete_prefix_length("a\xE2\x82") == 1);
static_assert(complete_prefix_length("\xF0\x9F\x98\x80") == 4);
static_assert(complete_prefix_length("\xF0\x9F\x98") == 0);

} // namespace grader::utf8
