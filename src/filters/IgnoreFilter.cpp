#include "IgnoreFilter.hpp"

#include "log/LogManager.hpp"
#include "utils/TextUtils.hpp"

namespace checkend::filters
{

IgnoreRule ignoreName(std::string name)
{
    return ByName{ std::move(name) };
}

std::optional<IgnoreRule> ignorePattern(const std::string& pattern)
{
    try
    {
        return IgnoreRule{ ByRegex{ pattern, std::regex(pattern, std::regex::ECMAScript) } };
    }
    catch (const std::regex_error& ex)
    {
        CHECKEND_LOG_WARN << "Invalid ignore pattern '" << pattern << "': " << ex.what();
        return std::nullopt;
    }
}

bool IgnoreFilter::shouldIgnore(const std::exception& ex, const std::vector<IgnoreRule>& rules)
{
    if (rules.empty())
        return false;

    const std::string class_name = utils::demangledName(typeid(ex));
    const std::string simple_name = utils::simpleName(class_name);
    for (const auto& rule : rules)
    {
        if (matches(&ex, class_name, simple_name, rule))
            return true;
    }
    return false;
}

bool IgnoreFilter::shouldIgnore(const std::string& class_name, const std::vector<IgnoreRule>& rules)
{
    if (rules.empty())
        return false;

    const std::string simple_name = utils::simpleName(class_name);
    for (const auto& rule : rules)
    {
        if (matches(nullptr, class_name, simple_name, rule))
            return true;
    }
    return false;
}

std::string IgnoreFilter::describe(const IgnoreRule& rule)
{
    if (auto* by_type = std::get_if<ByType>(&rule))
        return "type:" + by_type->type_name;
    if (auto* by_name = std::get_if<ByName>(&rule))
        return "name:" + by_name->name;
    return "pattern:" + std::get<ByRegex>(rule).pattern;
}

bool IgnoreFilter::matches(const std::exception* ex, const std::string& class_name, const std::string& simple_name,
                           const IgnoreRule& rule)
{
    if (auto* by_type = std::get_if<ByType>(&rule))
        return ex && by_type->matches && by_type->matches(*ex);

    if (auto* by_name = std::get_if<ByName>(&rule))
    {
        const auto& name = by_name->name;
        if (name.empty())
            return false;
        return class_name == name || simple_name == name || utils::endsWith(class_name, "::" + name);
    }

    const auto& by_regex = std::get<ByRegex>(rule);
    return std::regex_match(class_name, by_regex.regex) || std::regex_match(simple_name, by_regex.regex);
}

} // namespace checkend::filters
