#ifndef TTL_CACHE_HPP
#define TTL_CACHE_HPP

#include <chrono>
#include <functional>
#include <optional>

// Single cached value that expires `ttl` after it was stored.
template <typename T>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using Now = std::function<Clock::time_point()>;

    explicit TtlCache(Clock::duration ttl, Now now = [] { return Clock::now(); })
        : ttl_(ttl), now_(std::move(now)) {}

    std::optional<T> get() const {
        if (value_ && now_() - stored_at_ < ttl_) {
            return value_;
        }
        return std::nullopt;
    }

    void put(T value) {
        value_ = std::move(value);
        stored_at_ = now_();
    }

    void invalidate() { value_.reset(); }

private:
    Clock::duration ttl_;
    Now now_;
    std::optional<T> value_;
    Clock::time_point stored_at_{};
};

#endif
