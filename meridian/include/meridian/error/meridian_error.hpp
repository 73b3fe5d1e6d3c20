#ifndef MERIDIAN_ERROR_HPP
#define MERIDIAN_ERROR_HPP

#include <system_error>
#include <string>

// =======================================================================
// 🔹 命名空间： meridian_error::routing (路由匹配结果)
// 404 / 405 是正常分支，不是异常，以 error_code 的形式返回给调用方
// =======================================================================
namespace meridian_error::routing {
    enum class code {
        not_found = 1,          // 没有任何路由匹配该路径
        method_not_allowed,     // 路径存在，但不支持当前 HTTP 方法
    };

    class category_impl final : public std::error_category {
    public:
        const char* name() const noexcept override {
            return "routing_error";
        }

        std::string message(int ev) const override {
            switch (static_cast<code>(ev)) {
                case code::not_found: return "No route matches the request";
                case code::method_not_allowed: return "Route exists but the method is not allowed";
                default: return "Unknown routing error";
            }
        }
    };

    inline const std::error_category& category() {
        static category_impl instance;
        return instance;
    }

    // ADL
    inline std::error_code make_error_code(code e) {
        return {static_cast<int>(e), category()};
    }

    inline const std::error_code not_found          = make_error_code(code::not_found);
    inline const std::error_code method_not_allowed = make_error_code(code::method_not_allowed);

} // namespace meridian_error::routing


namespace std {
    template <>
    struct is_error_code_enum<meridian_error::routing::code> : true_type {};
} // namespace std

#endif //MERIDIAN_ERROR_HPP
