#pragma once

#include "Value.hpp"

namespace checkend
{

/**
 * @brief Per-request data threaded explicitly into notify calls.
 *
 * Owned by whoever handles the logical request (a connection handler, a job runner) and passed
 * to Checkend::notify. Nothing is stored in thread-local or global state.
 */
class NoticeContext
{
public:
    // Setters merge into the existing map; later keys replace earlier ones.
    void setContext(const Value::Object& values) { merge(context_, values); }
    void setUser(const Value::Object& values) { merge(user_, values); }
    void setRequest(const Value::Object& values) { merge(request_, values); }

    const Value::Object& context() const { return context_; }
    const Value::Object& user() const { return user_; }
    const Value::Object& request() const { return request_; }

    void clear()
    {
        context_.clear();
        user_.clear();
        request_.clear();
    }

private:
    static void merge(Value::Object& target, const Value::Object& values)
    {
        for (const auto& [key, value] : values)
            target.insert_or_assign(key, value);
    }

    Value::Object context_;
    Value::Object user_;
    Value::Object request_;
};

} // namespace checkend
