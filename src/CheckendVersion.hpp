#pragma once

#define CHECKEND_SDK_NAME "checkend-cpp"
#define CHECKEND_SDK_VERSION "0.1.0"

namespace checkend
{

inline constexpr const char* kSdkName = CHECKEND_SDK_NAME;
inline constexpr const char* kSdkVersion = CHECKEND_SDK_VERSION;

} // namespace checkend
