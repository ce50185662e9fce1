#include "Base64.hpp"

#include <cstdint>

namespace checkend::utils
{

std::string base64Encode(std::string_view input)
{
    static constexpr const char* kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < input.size(); i += 3)
    {
        const std::uint32_t n = (static_cast<std::uint8_t>(input[i]) << 16) |
                                (static_cast<std::uint8_t>(input[i + 1]) << 8) |
                                static_cast<std::uint8_t>(input[i + 2]);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back(kAlphabet[n & 0x3F]);
    }

    const std::size_t rest = input.size() - i;
    if (rest == 1)
    {
        const std::uint32_t n = static_cast<std::uint8_t>(input[i]) << 16;
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out += "==";
    }
    else if (rest == 2)
    {
        const std::uint32_t n = (static_cast<std::uint8_t>(input[i]) << 16) |
                                (static_cast<std::uint8_t>(input[i + 1]) << 8);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

} // namespace checkend::utils
