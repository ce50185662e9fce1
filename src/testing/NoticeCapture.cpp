#include "NoticeCapture.hpp"

namespace checkend::testing
{

void NoticeCapture::record(Notice notice)
{
    std::lock_guard<std::mutex> lock(mtx_);
    notices_.push_back(std::move(notice));
}

std::vector<Notice> NoticeCapture::notices() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return notices_;
}

std::optional<Notice> NoticeCapture::first() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (notices_.empty())
        return std::nullopt;
    return notices_.front();
}

std::optional<Notice> NoticeCapture::last() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (notices_.empty())
        return std::nullopt;
    return notices_.back();
}

std::size_t NoticeCapture::count() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return notices_.size();
}

bool NoticeCapture::empty() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return notices_.empty();
}

void NoticeCapture::clear()
{
    std::lock_guard<std::mutex> lock(mtx_);
    notices_.clear();
}

} // namespace checkend::testing
