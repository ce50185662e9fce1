#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace checkend
{

using Json = nlohmann::ordered_json;

/**
 * @brief Loosely typed value for user-supplied context, user and request data.
 *
 * Objects and arrays are held by shared pointer so the same container can appear in several
 * places, including inside itself. Copying a Value copies the reference, not the container.
 * Anything that is not JSON-shaped can be carried as an Opaque whose string form is produced
 * lazily.
 */
class Value
{
public:
    using Object = std::map<std::string, Value>;
    using Array = std::vector<Value>;
    using ObjectPtr = std::shared_ptr<Object>;
    using ArrayPtr = std::shared_ptr<Array>;

    struct Opaque
    {
        std::function<std::string()> describe;
    };

    using Storage =
        std::variant<std::nullptr_t, bool, std::int64_t, std::uint64_t, double, std::string, ObjectPtr, ArrayPtr, Opaque>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b)
        : storage_(b)
    {
    }

    template <typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> && std::is_signed_v<T>, int> = 0>
    Value(T n)
        : storage_(static_cast<std::int64_t>(n))
    {
    }

    template <typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> && std::is_unsigned_v<T>, int> = 0>
    Value(T n)
        : storage_(static_cast<std::uint64_t>(n))
    {
    }

    template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    Value(T d)
        : storage_(static_cast<double>(d))
    {
    }

    Value(const char* s)
        : storage_(std::string(s ? s : ""))
    {
    }
    Value(std::string s)
        : storage_(std::move(s))
    {
    }
    Value(Object obj)
        : storage_(std::make_shared<Object>(std::move(obj)))
    {
    }
    Value(Array arr)
        : storage_(std::make_shared<Array>(std::move(arr)))
    {
    }
    Value(ObjectPtr obj)
        : storage_(std::move(obj))
    {
    }
    Value(ArrayPtr arr)
        : storage_(std::move(arr))
    {
    }
    Value(Opaque opaque)
        : storage_(std::move(opaque))
    {
    }

    static Value object(std::initializer_list<Object::value_type> entries) { return Value(Object(entries)); }
    static Value array(std::initializer_list<Value> items) { return Value(Array(items)); }

    /// Wraps any streamable value; its text is produced when the value is sanitized.
    template <typename T>
    static Value opaque(T item)
    {
        return Value(Opaque{ [item = std::move(item)]() {
            std::ostringstream ss;
            ss << item;
            return ss.str();
        } });
    }

    bool isNull() const;
    bool isBool() const { return std::holds_alternative<bool>(storage_); }
    bool isNumber() const;
    bool isString() const { return std::holds_alternative<std::string>(storage_); }
    bool isObject() const;
    bool isArray() const;
    bool isOpaque() const { return std::holds_alternative<Opaque>(storage_); }

    // Accessors assume the matching is*() check; they throw std::bad_variant_access otherwise.
    bool asBool() const { return std::get<bool>(storage_); }
    const std::string& asString() const { return std::get<std::string>(storage_); }
    const ObjectPtr& asObject() const { return std::get<ObjectPtr>(storage_); }
    const ArrayPtr& asArray() const { return std::get<ArrayPtr>(storage_); }
    std::int64_t asInt() const;
    double asDouble() const;

    const Storage& storage() const { return storage_; }

    /// Renders the value as JSON. The value must be acyclic (run it through SanitizeFilter first).
    Json toJson() const;

    /// Converts parsed JSON into an independent Value tree.
    static Value fromJson(const Json& json);

private:
    Storage storage_{ nullptr };
};

/// JSON rendering of a whole object. Same acyclic precondition as Value::toJson().
Json toJson(const Value::Object& object);

} // namespace checkend
