#ifndef MERIDIAN_URL_GENERATOR_HPP
#define MERIDIAN_URL_GENERATOR_HPP

#include <map>
#include <string>
#include <string_view>

#include <meridian/utils/config/MeridianConfig.hpp>

namespace meridian {

    class Route;
    class Router;

    using RouteParameters = std::map<std::string, std::string, std::less<>>;

    /**
     * @class UrlGenerator
     * @brief 根据路由名称与参数生成 URL。
     *
     * - `{p}` / `{p?}` / `{p:key}` 用参数值替换，未提供的可选参数连同前面的 '/' 一起去掉
     * - 未提供的必填参数全部列在 MissingRouteParameter 中
     * - 没有被路径或域名用掉的参数拼成查询字符串
     * - absolute 时使用路由的协议与域名，未设置则使用 [app].url
     */
    class UrlGenerator {
    public:
        explicit UrlGenerator(const Router& router, AppConfig app = {});

        /**
         * @throws RouteNotFound 名称不存在（编辑距离小于 3 时附带建议）
         * @throws MissingRouteParameter
         */
        std::string route(std::string_view name, const RouteParameters& params = {}, bool absolute = false) const;

        /// @throws MissingRouteParameter
        std::string generate(const Route& route, const RouteParameters& params = {}, bool absolute = false) const;

        /// 与名称最接近的已注册路由名（距离 < 3），没有则为空
        std::string suggest(std::string_view name) const;

    private:
        const Router& router_;
        AppConfig app_;
    };

} // namespace meridian

#endif //MERIDIAN_URL_GENERATOR_HPP
