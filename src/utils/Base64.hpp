#pragma once

#include <string>
#include <string_view>

namespace checkend::utils
{

// Standard alphabet, padded.
std::string base64Encode(std::string_view input);

} // namespace checkend::utils
