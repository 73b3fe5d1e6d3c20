#ifndef MERIDIAN_ARGUMENT_RESOLVER_HPP
#define MERIDIAN_ARGUMENT_RESOLVER_HPP

#include <optional>
#include <set>
#include <string>
#include <vector>

#include <meridian/container/container.hpp>
#include <meridian/routing/handler.hpp>

namespace meridian {

    class RequestContext;

    /**
     * @class ArgumentResolver
     * @brief 按声明顺序为 handler 的每个参数找值，每个参数第一条适用的规则胜出：
     *
     *  a. 框架类型（request / response / context）
     *  b. 对象类型，通过容器解析（自动校验输入、模型绑定）
     *  c. 同名路由参数（按声明类型转换）
     *  d. 同名请求属性
     *  e. 同名查询参数
     *  f. 同名 body 字段
     *  g. 同名上传文件
     *  h. 参数默认值
     *  i. 可空参数 -> null
     *  否则抛出 UnresolvableParameter。
     *
     * 可变参数收集所有未被前面具名参数消费的路由参数（按捕获顺序）。
     */
    class ArgumentResolver {
    public:
        explicit ArgumentResolver(Container& container) : container_(container) {}

        /// @throws UnresolvableParameter / ModelNotFound / ValidationFailed / MissingTarget
        Arguments resolve(const std::vector<ParamDescriptor>& parameters, RequestContext& ctx) const;

    private:
        std::optional<ArgumentValue> resolve_object(const ParamDescriptor& param, RequestContext& ctx,
                                                    std::set<std::string, std::less<>>& consumed) const;

        std::optional<ArgumentValue> resolve_by_name(const ParamDescriptor& param, RequestContext& ctx,
                                                     std::set<std::string, std::less<>>& consumed) const;

        static std::vector<std::string> available_sources(const RequestContext& ctx);

        Container& container_;
    };

} // namespace meridian

#endif //MERIDIAN_ARGUMENT_RESOLVER_HPP
