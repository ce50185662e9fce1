#pragma once

#include "notice/Value.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace checkend::filters
{

using FilterKeys = std::set<std::string>;

/**
 * @brief Scrubs sensitive and oversized data out of user-supplied maps.
 *
 * Any key whose lower-cased form contains a lower-cased filter key has its value replaced by
 * "[FILTERED]". Strings are cut to kMaxStringLength code points, nesting beyond kMaxDepth is
 * replaced by a `_truncated` marker and containers seen earlier in the same call by a
 * `_circular` marker. The output is a fresh tree that shares nothing with the input.
 *
 * filter() never throws.
 */
class SanitizeFilter
{
public:
    static constexpr const char* kFiltered = "[FILTERED]";
    static constexpr int kMaxDepth = 10;
    static constexpr std::size_t kMaxStringLength = 10000;

    static constexpr const char* kTruncatedKey = "_truncated";
    static constexpr const char* kTruncatedReason = "max depth exceeded";
    static constexpr const char* kCircularKey = "_circular";
    static constexpr const char* kCircularReason = "circular reference";
    static constexpr const char* kCircularListMarker = "_circular: circular reference";

    static Value::Object filter(const Value::Object& data, const FilterKeys& filter_keys);

    /// Null pointer yields an empty map.
    static Value::Object filter(const Value::ObjectPtr& data, const FilterKeys& filter_keys);

    static bool shouldFilter(const std::string& key, const FilterKeys& filter_keys);

private:
    struct Pass
    {
        std::vector<std::string> lowered_keys;
        std::unordered_set<const void*> seen;
    };

    static bool matchesAny(const std::string& key, const std::vector<std::string>& lowered_keys);
    static Value::Object filterObject(const Value::Object& data, int depth, Pass& pass);
    static Value filterArray(const Value::Array& data, int depth, Pass& pass);
    static Value filterValue(const Value& value, int depth, Pass& pass);
    static std::string truncate(const std::string& text);
    static std::vector<std::string> lowerKeys(const FilterKeys& filter_keys);
};

} // namespace checkend::filters
