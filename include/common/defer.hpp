#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = runbox::scoped_guard() + [&]

namespace runbox {

/**
 * @brief 在离开作用域时执行回调
 * 无论是正常返回还是抛出异常，回调都会被执行，用来保证容器一定会被清理。
 * 回调本身不能抛出异常。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    /**
     * @brief 取消回调，离开作用域时不再执行
     */
    void dismiss();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace runbox
