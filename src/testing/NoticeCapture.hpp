#pragma once

#include "notice/Notice.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace checkend::testing
{

/**
 * @brief In-memory recorder used instead of the network while attached to a Checkend instance.
 *
 *   auto capture = std::make_shared<checkend::testing::NoticeCapture>();
 *   checkend.attachCapture(capture);
 *   checkend.notify(ex);
 *   REQUIRE(capture->count() == 1);
 */
class NoticeCapture
{
public:
    void record(Notice notice);

    std::vector<Notice> notices() const;
    std::optional<Notice> first() const;
    std::optional<Notice> last() const;
    std::size_t count() const;
    bool empty() const;
    void clear();

private:
    mutable std::mutex mtx_;
    std::vector<Notice> notices_;
};

} // namespace checkend::testing
