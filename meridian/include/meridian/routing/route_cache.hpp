#ifndef MERIDIAN_ROUTE_CACHE_HPP
#define MERIDIAN_ROUTE_CACHE_HPP

#include <cstddef>
#include <string>

#include <boost/json/value.hpp>

namespace meridian {

    class Router;

    /**
     * @class RouteCache
     * @brief 持久化路由表：序列化为 JSON 文件，启动时重新走注册流程恢复。
     *
     * 每条路由记录 method / path / handler / middleware / name / wheres / defaults /
     * domain / scheme / bindings / meta。内联闭包（handler、中间件、装饰器）无法序列化。
     */
    class RouteCache {
    public:
        static constexpr int kFormatVersion = 1;

        /// @throws UncacheableHandler
        static boost::json::value serialize(const Router& router);

        /// @return 恢复的路由条数
        static std::size_t restore(Router& router, const boost::json::value& document);

        /// @throws UncacheableHandler / std::runtime_error（写文件失败）
        static void save(const Router& router, const std::string& file);

        /// @throws std::runtime_error 文件不存在或格式错误
        static std::size_t load(Router& router, const std::string& file);
    };

} // namespace meridian

#endif //MERIDIAN_ROUTE_CACHE_HPP
