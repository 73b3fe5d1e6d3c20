#ifndef MERIDIAN_FINALLY_HPP
#define MERIDIAN_FINALLY_HPP

#include <exception>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

namespace meridian {

    /**
     * @struct Finally
     * @brief 作用域守卫：离开作用域（正常返回或异常展开）时执行清理动作。
     *
     * Router::group 用它保证作用域栈在回调抛出异常时也能恢复。
     */
    template<typename Func>
    struct [[nodiscard]] Finally {
        Func func;
        bool active = true;

        explicit Finally(Func&& f) noexcept : func(std::move(f)) {}

        Finally(Finally&& other) noexcept : func(std::move(other.func)), active(other.active) {
            other.active = false;
        }

        ~Finally() noexcept {
            if (!active) return;
            if constexpr (std::is_nothrow_invocable_v<Func>) {
                func();
            } else {
                // 析构函数中不能再抛出，记录后继续展开
                try {
                    func();
                } catch (const std::exception& e) {
                    SPDLOG_ERROR("Scope guard cleanup failed: {}", e.what());
                }
            }
        }

        /// 解除守卫，清理动作不再执行
        void release() noexcept { active = false; }

        Finally(const Finally&) = delete;
        Finally& operator=(const Finally&) = delete;
        Finally& operator=(Finally&&) = delete;
    };

    template<typename Func>
    [[nodiscard]] auto make_finally(Func&& f) {
        return Finally<std::decay_t<Func>>(std::forward<Func>(f));
    }

} // namespace meridian

#endif //MERIDIAN_FINALLY_HPP
