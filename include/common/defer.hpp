#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = ptyrun::scoped_guard() + [&]

namespace ptyrun {

/**
 * @brief Runs a cleanup callback when leaving the scope
 * Cleanup must never mask the error that is unwinding the stack, so an
 * exception thrown by the callback is logged and dropped.
 * @code{.cpp}
 *     int fd = open(...);
 *     defer { close(fd); };
 * @endcode
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace ptyrun
