#ifndef MERIDIAN_GROUP_SCOPE_HPP
#define MERIDIAN_GROUP_SCOPE_HPP

#include <optional>
#include <string>
#include <vector>

#include <meridian/dispatch/middleware.hpp>
#include <meridian/http/http_common_types.hpp>

namespace meridian {

    /**
     * @struct GroupAttributes
     * @brief group() 的属性。未设置的字段沿用外层分组。
     */
    struct GroupAttributes {
        std::optional<std::string> prefix;
        std::vector<MiddlewareRef> middleware;
        std::optional<std::string> name_space;  // handler 目标类型的命名空间
        std::optional<std::string> domain;
        ConstraintMap where;
        std::optional<std::string> as;          // 路由名称前缀
    };

    /**
     * @struct GroupFrame
     * @brief 分组栈中的一帧：进入分组时由外层帧与属性合并得到。
     *
     * prefix / middleware / where / 名称前缀 追加到外层值之后；
     * namespace 与 domain 被设置时直接替换外层值。
     */
    struct GroupFrame {
        std::string prefix;
        std::vector<MiddlewareRef> middleware;
        std::string name_space;
        std::optional<std::string> domain;
        ConstraintMap where;
        std::string name_prefix;

        GroupFrame merged(const GroupAttributes& attributes) const;
    };

    /// 去掉首尾的 '/'
    std::string trim_slashes(std::string_view sv);

} // namespace meridian

#endif //MERIDIAN_GROUP_SCOPE_HPP
