#ifndef MERIDIAN_HTTP_COMMON_TYPES_HPP
#define MERIDIAN_HTTP_COMMON_TYPES_HPP

#include <boost/beast/http.hpp>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>

namespace meridian {

    // 透明 Hasher：允许直接用 string_view 查找，避免临时 std::string
    struct StringHash {
        using is_transparent = void;

        size_t operator()(std::string_view sv) const {
            return std::hash<std::string_view>{}(sv);
        }
    };

    struct StringEqual {
        using is_transparent = void;

        bool operator()(std::string_view a, std::string_view b) const {
            return a == b;
        }
    };

    namespace http = boost::beast::http;

    using HttpRequest  = http::request<http::string_body>;
    using HttpResponse = http::response<http::string_body>;

    using Headers = http::fields;

    /// 路由参数：参数名 -> 捕获值
    using PathParams = std::unordered_map<std::string, std::string, StringHash, StringEqual>;

    /// 参数约束：参数名 -> 正则。使用有序 map，保证序列化与日志输出稳定
    using ConstraintMap = std::map<std::string, std::string, std::less<>>;

    /// 可选参数的默认值
    using DefaultMap = std::map<std::string, std::string, std::less<>>;

} // namespace meridian

#endif //MERIDIAN_HTTP_COMMON_TYPES_HPP
