#include "../include/cancel.hpp"
#include <algorithm>

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

void CancelToken::set_deadline(clock::time_point deadline) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        deadline_ = deadline;
    }
    cv_.notify_all();
}

bool CancelToken::deadline_passed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return deadline_ && clock::now() >= *deadline_;
}

bool CancelToken::cancelled() const {
    return cancelled_.load() || deadline_passed();
}

std::optional<std::chrono::milliseconds> CancelToken::remaining() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!deadline_) return std::nullopt;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

bool CancelToken::wait_for(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lock(mtx_);
    auto until = clock::now() + d;
    if (deadline_ && *deadline_ < until) until = *deadline_;
    cv_.wait_until(lock, until, [&]{ return cancelled_.load(); });
    if (cancelled_.load()) return false;
    return !(deadline_ && clock::now() >= *deadline_);
}
