#pragma once

#include <functional>

#define RUNBOX_DEFER_1(x, y) x##y
#define RUNBOX_DEFER_2(x, y) RUNBOX_DEFER_1(x, y)
#define RUNBOX_DEFER_0(x) RUNBOX_DEFER_2(x, __COUNTER__)
#define defer auto RUNBOX_DEFER_0(_defered_option) = runbox::scoped_guard() + [&]

namespace runbox {

/**
 * @brief 作用域守卫，离开作用域时执行清理函数
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

}  // namespace runbox
