#include "SanitizeFilter.hpp"

#include "log/LogManager.hpp"
#include "utils/TextUtils.hpp"

#include <exception>
#include <variant>

namespace checkend::filters
{

namespace
{

Value::Object truncatedMarker()
{
    return Value::Object{ { SanitizeFilter::kTruncatedKey, Value(SanitizeFilter::kTruncatedReason) } };
}

} // namespace

Value::Object SanitizeFilter::filter(const Value::Object& data, const FilterKeys& filter_keys)
{
    if (data.empty())
        return {};

    Pass pass;
    pass.lowered_keys = lowerKeys(filter_keys);
    return filterObject(data, 0, pass);
}

Value::Object SanitizeFilter::filter(const Value::ObjectPtr& data, const FilterKeys& filter_keys)
{
    if (!data)
        return {};
    return filter(*data, filter_keys);
}

bool SanitizeFilter::shouldFilter(const std::string& key, const FilterKeys& filter_keys)
{
    return matchesAny(key, lowerKeys(filter_keys));
}

bool SanitizeFilter::matchesAny(const std::string& key, const std::vector<std::string>& lowered_keys)
{
    if (lowered_keys.empty())
        return false;
    const std::string lower_key = utils::toLowerUtf8(key);
    for (const auto& filter_key : lowered_keys)
    {
        if (lower_key.find(filter_key) != std::string::npos)
            return true;
    }
    return false;
}

std::vector<std::string> SanitizeFilter::lowerKeys(const FilterKeys& filter_keys)
{
    std::vector<std::string> lowered;
    lowered.reserve(filter_keys.size());
    for (const auto& key : filter_keys)
    {
        // An empty filter key would match every field.
        if (!key.empty())
            lowered.push_back(utils::toLowerUtf8(key));
    }
    return lowered;
}

Value::Object SanitizeFilter::filterObject(const Value::Object& data, int depth, Pass& pass)
{
    if (depth > kMaxDepth)
        return truncatedMarker();

    if (!pass.seen.insert(&data).second)
        return Value::Object{ { kCircularKey, Value(kCircularReason) } };

    Value::Object result;
    for (const auto& [key, value] : data)
    {
        if (matchesAny(key, pass.lowered_keys))
            result.emplace(key, Value(kFiltered));
        else
            result.emplace(key, filterValue(value, depth + 1, pass));
    }
    return result;
}

Value SanitizeFilter::filterArray(const Value::Array& data, int depth, Pass& pass)
{
    if (depth > kMaxDepth)
        return Value(truncatedMarker());

    if (!pass.seen.insert(&data).second)
        return Value::array({ Value(kCircularListMarker) });

    Value::Array result;
    result.reserve(data.size());
    for (const auto& item : data)
        result.push_back(filterValue(item, depth + 1, pass));
    return Value(std::move(result));
}

Value SanitizeFilter::filterValue(const Value& value, int depth, Pass& pass)
{
    const auto& storage = value.storage();

    if (value.isNull())
        return Value();
    if (value.isBool() || value.isNumber())
        return value;
    if (auto* s = std::get_if<std::string>(&storage))
        return Value(truncate(*s));
    if (auto* obj = std::get_if<Value::ObjectPtr>(&storage))
        return Value(filterObject(**obj, depth, pass));
    if (auto* arr = std::get_if<Value::ArrayPtr>(&storage))
        return filterArray(**arr, depth, pass);

    const auto& opaque = std::get<Value::Opaque>(storage);
    if (!opaque.describe)
        return Value(std::string());
    try
    {
        return Value(truncate(opaque.describe()));
    }
    catch (const std::exception& ex)
    {
        CHECKEND_LOG_DEBUG << "Opaque value could not be rendered: " << ex.what();
        return Value(std::string("[UNPRINTABLE]"));
    }
    catch (...)
    {
        CHECKEND_LOG_DEBUG << "Opaque value could not be rendered";
        return Value(std::string("[UNPRINTABLE]"));
    }
}

std::string SanitizeFilter::truncate(const std::string& text)
{
    return utils::utf8Truncate(text, kMaxStringLength);
}

} // namespace checkend::filters
