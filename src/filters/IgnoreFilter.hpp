#pragma once

#include "utils/TypeName.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace checkend::filters
{

/// Matches the exception's dynamic type or any type derived from it.
struct ByType
{
    std::string type_name;
    std::function<bool(const std::exception&)> matches;
};

/// Matches the full demangled name, the simple name, or a `::name` suffix.
struct ByName
{
    std::string name;
};

/// Fully matches the full or the simple name.
struct ByRegex
{
    std::string pattern;
    std::regex regex;
};

using IgnoreRule = std::variant<ByType, ByName, ByRegex>;

template <typename E>
IgnoreRule ignoreType()
{
    return ByType{ utils::demangledName(typeid(E)),
                   [](const std::exception& ex) { return dynamic_cast<const E*>(&ex) != nullptr; } };
}

IgnoreRule ignoreName(std::string name);

/// Returns nullopt when `pattern` is not a valid ECMAScript regex.
std::optional<IgnoreRule> ignorePattern(const std::string& pattern);

class IgnoreFilter
{
public:
    static bool shouldIgnore(const std::exception& ex, const std::vector<IgnoreRule>& rules);

    /// Name-only check for faults that are not C++ exceptions; ByType rules never match here.
    static bool shouldIgnore(const std::string& class_name, const std::vector<IgnoreRule>& rules);

    static std::string describe(const IgnoreRule& rule);

private:
    static bool matches(const std::exception* ex, const std::string& class_name, const std::string& simple_name,
                        const IgnoreRule& rule);
};

} // namespace checkend::filters
