#include "Value.hpp"

namespace checkend
{

bool Value::isNull() const
{
    if (std::holds_alternative<std::nullptr_t>(storage_))
        return true;
    if (auto* obj = std::get_if<ObjectPtr>(&storage_))
        return !*obj;
    if (auto* arr = std::get_if<ArrayPtr>(&storage_))
        return !*arr;
    return false;
}

bool Value::isNumber() const
{
    return std::holds_alternative<std::int64_t>(storage_) || std::holds_alternative<std::uint64_t>(storage_) ||
           std::holds_alternative<double>(storage_);
}

bool Value::isObject() const
{
    auto* obj = std::get_if<ObjectPtr>(&storage_);
    return obj && *obj;
}

bool Value::isArray() const
{
    auto* arr = std::get_if<ArrayPtr>(&storage_);
    return arr && *arr;
}

std::int64_t Value::asInt() const
{
    if (auto* i = std::get_if<std::int64_t>(&storage_))
        return *i;
    if (auto* u = std::get_if<std::uint64_t>(&storage_))
        return static_cast<std::int64_t>(*u);
    return static_cast<std::int64_t>(std::get<double>(storage_));
}

double Value::asDouble() const
{
    if (auto* d = std::get_if<double>(&storage_))
        return *d;
    if (auto* u = std::get_if<std::uint64_t>(&storage_))
        return static_cast<double>(*u);
    return static_cast<double>(std::get<std::int64_t>(storage_));
}

Json Value::toJson() const
{
    struct Renderer
    {
        Json operator()(std::nullptr_t) const { return nullptr; }
        Json operator()(bool b) const { return b; }
        Json operator()(std::int64_t n) const { return n; }
        Json operator()(std::uint64_t n) const { return n; }
        Json operator()(double d) const { return d; }
        Json operator()(const std::string& s) const { return s; }
        Json operator()(const ObjectPtr& obj) const
        {
            if (!obj)
                return nullptr;
            return checkend::toJson(*obj);
        }
        Json operator()(const ArrayPtr& arr) const
        {
            if (!arr)
                return nullptr;
            Json out = Json::array();
            for (const auto& item : *arr)
                out.push_back(item.toJson());
            return out;
        }
        Json operator()(const Opaque& opaque) const
        {
            return opaque.describe ? opaque.describe() : std::string();
        }
    };
    return std::visit(Renderer{}, storage_);
}

Value Value::fromJson(const Json& json)
{
    switch (json.type())
    {
    case Json::value_t::boolean:
        return Value(json.get<bool>());
    case Json::value_t::number_integer:
        return Value(json.get<std::int64_t>());
    case Json::value_t::number_unsigned:
        return Value(json.get<std::uint64_t>());
    case Json::value_t::number_float:
        return Value(json.get<double>());
    case Json::value_t::string:
        return Value(json.get<std::string>());
    case Json::value_t::object:
    {
        Object obj;
        for (const auto& [key, item] : json.items())
            obj.insert_or_assign(key, fromJson(item));
        return Value(std::move(obj));
    }
    case Json::value_t::array:
    {
        Array arr;
        arr.reserve(json.size());
        for (const auto& item : json)
            arr.push_back(fromJson(item));
        return Value(std::move(arr));
    }
    default:
        return Value();
    }
}

Json toJson(const Value::Object& object)
{
    Json out = Json::object();
    for (const auto& [key, value] : object)
        out[key] = value.toJson();
    return out;
}

} // namespace checkend
