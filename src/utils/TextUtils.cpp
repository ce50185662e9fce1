#include "TextUtils.hpp"

#include <utf8proc.h>

namespace checkend::utils
{

namespace
{

// Length in bytes of the code point starting at `pos`, or 1 for an invalid byte.
utf8proc_ssize_t nextCodepoint(std::string_view text, std::size_t pos, utf8proc_int32_t& cp)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data() + pos);
    const auto len = static_cast<utf8proc_ssize_t>(text.size() - pos);
    utf8proc_ssize_t bytes = utf8proc_iterate(str, len, &cp);
    if (bytes <= 0)
    {
        cp = -1;
        return 1;
    }
    return bytes;
}

} // namespace

std::size_t utf8Length(std::string_view text)
{
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        utf8proc_int32_t cp;
        pos += static_cast<std::size_t>(nextCodepoint(text, pos, cp));
        ++count;
    }
    return count;
}

std::string utf8Truncate(const std::string& text, std::size_t max_chars)
{
    // Fast path: byte length bounds code point length.
    if (text.size() <= max_chars)
        return text;

    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size() && count < max_chars)
    {
        utf8proc_int32_t cp;
        pos += static_cast<std::size_t>(nextCodepoint(text, pos, cp));
        ++count;
    }
    return text.substr(0, pos);
}

std::string toLowerUtf8(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size())
    {
        utf8proc_int32_t cp;
        const auto bytes = static_cast<std::size_t>(nextCodepoint(text, pos, cp));
        if (cp < 0)
        {
            out.push_back(text[pos]);
        }
        else
        {
            utf8proc_uint8_t buffer[4];
            utf8proc_ssize_t written = utf8proc_encode_char(utf8proc_tolower(cp), buffer);
            if (written > 0)
                out.append(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(written));
            else
                out.append(text.substr(pos, bytes));
        }
        pos += bytes;
    }
    return out;
}

bool endsWith(std::string_view text, std::string_view suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsWith(std::string_view text, std::string_view prefix)
{
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace checkend::utils
