#pragma once
#include <thread>
#include <utility>

// Compatibility alias for `std::jthread`.
// Without library support a minimal wrapper around `std::thread` is used that
// joins on destruction but has no stop token.
#if defined(__cpp_lib_jthread)
#include <stop_token>
namespace th_compat {
using jthread = std::jthread;
}
#else
namespace th_compat {
class jthread {
    std::thread t;

  public:
    jthread() noexcept = default;
    template <class Fn, class... Args>
    explicit jthread(Fn&& fn, Args&&... args)
        : t(std::forward<Fn>(fn), std::forward<Args>(args)...) {}
    jthread(jthread&&) noexcept = default;
    jthread& operator=(jthread&& other) noexcept {
        if (this != &other) {
            join();
            t = std::move(other.t);
        }
        return *this;
    }
    ~jthread() { join(); }
    void join() {
        if (t.joinable())
            t.join();
    }
    bool joinable() const noexcept { return t.joinable(); }
    std::thread::id get_id() const noexcept { return t.get_id(); }
};
} // namespace th_compat
#endif
