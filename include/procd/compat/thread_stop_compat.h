// Portability shim for std::jthread/std::stop_token on standard libraries that lack them.
// Prefer native C++20 types when available; otherwise provide a flag-based fallback.
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <type_traits>

#if __has_include(<version>)
#include <version>
#endif

#if __has_include(<stop_token>)
#include <stop_token>
#endif

namespace procd::compat {

#if defined(__cpp_lib_jthread) && (__cpp_lib_jthread >= 201911L)
using jthread = std::jthread;
using stop_token = std::stop_token;
using stop_source = std::stop_source;

#else

// Fallback stop_token: observes a flag shared with its stop_source
class stop_token {
public:
    stop_token() = default;
    explicit stop_token(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}
    bool stop_requested() const noexcept {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

class stop_source {
public:
    stop_source() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    stop_token get_token() const noexcept { return stop_token{flag_}; }
    bool request_stop() noexcept { return !flag_->exchange(true, std::memory_order_acq_rel); }
    bool stop_requested() const noexcept { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Fallback jthread: std::thread that joins on destruction and passes a stop_token when the
// callable accepts one
class jthread {
public:
    jthread() = default;

    template <class F, class... Args> explicit jthread(F&& f, Args&&... args) {
        auto token = source_.get_token();
        t_ = std::thread(
            [fn = std::forward<F>(f), token, ... as = std::forward<Args>(args)]() mutable {
                if constexpr (std::is_invocable_v<F, stop_token, Args...>) {
                    fn(token, as...);
                } else {
                    fn(as...);
                }
            });
    }

    jthread(const jthread&) = delete;
    jthread& operator=(const jthread&) = delete;

    jthread(jthread&& other) noexcept
        : source_(std::move(other.source_)), t_(std::move(other.t_)) {}
    jthread& operator=(jthread&& other) noexcept {
        if (this != &other) {
            if (t_.joinable()) {
                source_.request_stop();
                t_.join();
            }
            source_ = std::move(other.source_);
            t_ = std::move(other.t_);
        }
        return *this;
    }

    ~jthread() {
        if (t_.joinable()) {
            source_.request_stop();
            t_.join();
        }
    }

    bool joinable() const noexcept { return t_.joinable(); }
    void join() { t_.join(); }
    bool request_stop() noexcept { return source_.request_stop(); }
    stop_source get_stop_source() const noexcept { return source_; }

private:
    stop_source source_;
    std::thread t_;
};

#endif // __cpp_lib_jthread

} // namespace procd::compat
