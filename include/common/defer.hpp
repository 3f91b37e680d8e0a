#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在离开作用域时执行代码块
 * @code{.cpp}
 *     std::string id = client.create_container(spec);
 *     defer { client.remove_container(id); };
 * @endcode
 */
#define defer auto DEFER_0(_deferred_action) = coderun::scope_exit() + [&]

namespace coderun {

/**
 * @brief 作用域守卫，析构时调用保存的回调
 * 回调抛出的异常会被析构函数吞掉前记录日志，因此回调中应当自行处理错误
 */
struct scope_exit {
    scope_exit();
    explicit scope_exit(std::function<void()> f);
    scope_exit(scope_exit &&other) noexcept;
    scope_exit(const scope_exit &) = delete;
    ~scope_exit();

    scope_exit &operator=(const scope_exit &) = delete;

    scope_exit operator+(std::function<void()> f) const;

    /**
     * @brief 取消回调，之后析构时不再执行
     */
    void dismiss();

private:
    std::function<void()> f;
};

}  // namespace coderun
