#ifndef MERIDIAN_METHOD_HPP
#define MERIDIAN_METHOD_HPP

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include <meridian/http/http_common_types.hpp>

namespace meridian {

    /// 路由表支持的固定动词集合（注册顺序即 any() 的展开顺序）
    inline constexpr std::array<http::verb, 7> kRoutableMethods = {
        http::verb::get,
        http::verb::post,
        http::verb::put,
        http::verb::delete_,
        http::verb::patch,
        http::verb::options,
        http::verb::head,
    };

    /**
     * @brief 将方法字符串（大小写不敏感）解析为 http::verb。
     * @throws InvalidMethod 不在 kRoutableMethods 中的方法
     */
    http::verb parse_method(std::string_view method);

    /// http::verb -> "GET" 等大写名称
    std::string_view method_name(http::verb method);

    /// 用 ", " 连接方法名，用于 Allow 头
    std::string join_methods(const std::vector<http::verb>& methods);

} // namespace meridian

#endif //MERIDIAN_METHOD_HPP
