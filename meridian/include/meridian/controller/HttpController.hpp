#ifndef MERIDIAN_HTTP_CONTROLLER_HPP
#define MERIDIAN_HTTP_CONTROLLER_HPP

#include <map>
#include <string>
#include <string_view>

#include <meridian/routing/handler.hpp>

namespace meridian {

    class Router;

    /**
     * @class HttpController
     * @brief 控制器基类。
     *
     * - registerRoutes：控制器自己注册路由（App::addController 时调用）
     * - 动作表：`"Target@method"` 形式的 handler 通过容器取到控制器后，按方法名在这里查找
     */
    class HttpController {
    public:
        virtual ~HttpController() = default;

        virtual void registerRoutes(Router&) {}

        /// 按方法名查找动作，不存在返回 nullptr
        const Action* find_action(std::string_view method) const {
            const auto it = actions_.find(method);
            return it == actions_.end() ? nullptr : &it->second;
        }

        bool has_action(std::string_view method) const { return actions_.find(method) != actions_.end(); }

    protected:
        void action(std::string name, Action action) {
            actions_.insert_or_assign(std::move(name), std::move(action));
        }

    private:
        std::map<std::string, Action, std::less<>> actions_;
    };

} // namespace meridian

#endif // MERIDIAN_HTTP_CONTROLLER_HPP
