#ifndef MERIDIAN_METHOD_OVERRIDE_HPP
#define MERIDIAN_METHOD_OVERRIDE_HPP

#include <string_view>

#include <meridian/http/http_common_types.hpp>

namespace meridian {

    class ServerRequest;

    /// body / 查询参数中的方法覆盖字段名
    inline constexpr std::string_view kMethodOverrideField = "_method";
    inline constexpr std::string_view kMethodOverrideHeader = "X-HTTP-Method-Override";

    /**
     * @brief 计算用于匹配的有效方法。
     *
     * 只有 POST 会检查覆盖信号，依次为 body `_method`、查询参数 `_method`、
     * `X-HTTP-Method-Override` 头，第一个存在的信号生效，且只接受 PUT / PATCH / DELETE。
     * HEAD 按 GET 匹配。
     */
    http::verb effective_method(const ServerRequest& request, bool allow_override = true);

} // namespace meridian

#endif //MERIDIAN_METHOD_OVERRIDE_HPP
