#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace checkend::utils
{

/// Number of UTF-8 code points in `text`. Invalid bytes count as one each.
std::size_t utf8Length(std::string_view text);

/// First `max_chars` code points of `text`; never splits a multi-byte sequence.
std::string utf8Truncate(const std::string& text, std::size_t max_chars);

/// Unicode-aware lower-casing via utf8proc. Invalid bytes are copied unchanged.
std::string toLowerUtf8(std::string_view text);

bool endsWith(std::string_view text, std::string_view suffix);

bool startsWith(std::string_view text, std::string_view prefix);

} // namespace checkend::utils
