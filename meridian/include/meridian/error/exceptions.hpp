#ifndef MERIDIAN_EXCEPTIONS_HPP
#define MERIDIAN_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <map>

namespace meridian {

    /// 框架内所有异常的基类
    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // ------------------------------------------------
    // 配置错误：注册阶段立即抛出，绝不延迟到请求阶段
    // ------------------------------------------------
    class ConfigurationError : public Error {
    public:
        using Error::Error;
    };

    class InvalidMethod final : public ConfigurationError {
    public:
        explicit InvalidMethod(const std::string& method)
            : ConfigurationError("Invalid HTTP method [" + method + "]"), method_(method) {}

        const std::string& method() const noexcept { return method_; }

    private:
        std::string method_;
    };

    class InvalidScheme final : public ConfigurationError {
    public:
        explicit InvalidScheme(const std::string& scheme)
            : ConfigurationError("Invalid scheme [" + scheme + "], expected http or https"), scheme_(scheme) {}

        const std::string& scheme() const noexcept { return scheme_; }

    private:
        std::string scheme_;
    };

    class DuplicateRouteName final : public ConfigurationError {
    public:
        explicit DuplicateRouteName(const std::string& name)
            : ConfigurationError("Route name [" + name + "] already exists"), name_(name) {}

        const std::string& name() const noexcept { return name_; }

    private:
        std::string name_;
    };

    /// 路由定义本身不合法（空方法列表、未知宏、未知中间件别名等）
    class InvalidRouteDefinition final : public ConfigurationError {
    public:
        using ConfigurationError::ConfigurationError;
    };

    // ------------------------------------------------
    // 解析错误：中止当前请求，按 5xx 处理
    // ------------------------------------------------
    class ResolutionError : public Error {
    public:
        using Error::Error;
    };

    /**
     * @brief handler 的某个参数无法从任何来源解析。
     * @note 诊断信息（参数名、位置、可用来源）只写日志，不能原样回显给客户端。
     */
    class UnresolvableParameter final : public ResolutionError {
    public:
        UnresolvableParameter(std::string name, std::size_t position, std::vector<std::string> available_sources);

        const std::string& name() const noexcept { return name_; }
        std::size_t position() const noexcept { return position_; }
        const std::vector<std::string>& available_sources() const noexcept { return available_sources_; }

    private:
        std::string name_;
        std::size_t position_;
        std::vector<std::string> available_sources_;
    };

    class MissingTarget final : public ResolutionError {
    public:
        explicit MissingTarget(const std::string& target)
            : ResolutionError("Target [" + target + "] not found"), target_(target) {}

        const std::string& target() const noexcept { return target_; }

    private:
        std::string target_;
    };

    class MissingTargetMethod final : public ResolutionError {
    public:
        MissingTargetMethod(const std::string& target, const std::string& method)
            : ResolutionError("Method [" + method + "] not found in target [" + target + "]"),
              target_(target), method_(method) {}

        const std::string& target() const noexcept { return target_; }
        const std::string& method() const noexcept { return method_; }

    private:
        std::string target_;
        std::string method_;
    };

    /// 模型绑定时按路由参数查不到记录
    class ModelNotFound final : public ResolutionError {
    public:
        ModelNotFound(const std::string& model, const std::string& field, const std::string& value)
            : ResolutionError("No query results for model [" + model + "] where " + field + " = " + value),
              model_(model) {}

        const std::string& model() const noexcept { return model_; }

    private:
        std::string model_;
    };

    /// 自动校验的输入对象校验失败，errors 为 字段 -> 错误信息列表
    class ValidationFailed final : public ResolutionError {
    public:
        explicit ValidationFailed(std::map<std::string, std::vector<std::string>> errors)
            : ResolutionError("The given data was invalid"), errors_(std::move(errors)) {}

        const std::map<std::string, std::vector<std::string>>& errors() const noexcept { return errors_; }

    private:
        std::map<std::string, std::vector<std::string>> errors_;
    };

    // ------------------------------------------------
    // handler 契约违规
    // ------------------------------------------------
    class HandlerContractViolation : public Error {
    public:
        using Error::Error;
    };

    class InvalidHandlerReturn final : public HandlerContractViolation {
    public:
        explicit InvalidHandlerReturn(const std::string& actual_type)
            : HandlerContractViolation(
                  "Route handler must return a response, string, JSON value, number, bool, stringable or null. Got: " + actual_type),
              actual_type_(actual_type) {}

        const std::string& actual_type() const noexcept { return actual_type_; }

    private:
        std::string actual_type_;
    };

    /// 内联函数 handler / 内联中间件无法写入持久化路由缓存
    class UncacheableHandler final : public HandlerContractViolation {
    public:
        explicit UncacheableHandler(const std::string& route)
            : HandlerContractViolation("Unable to cache route [" + route + "]: it uses an inline closure"), route_(route) {}

        const std::string& route() const noexcept { return route_; }

    private:
        std::string route_;
    };

    // ------------------------------------------------
    // URL 生成
    // ------------------------------------------------
    class RouteNotFound final : public Error {
    public:
        RouteNotFound(const std::string& name, const std::string& suggestion)
            : Error("Route [" + name + "] not found." + (suggestion.empty() ? "" : " Did you mean [" + suggestion + "]?")),
              name_(name) {}

        const std::string& name() const noexcept { return name_; }

    private:
        std::string name_;
    };

    class MissingRouteParameter final : public Error {
    public:
        MissingRouteParameter(const std::string& route, std::vector<std::string> missing);

        const std::vector<std::string>& missing() const noexcept { return missing_; }

    private:
        std::vector<std::string> missing_;
    };

    // ------------------------------------------------
    // 类型化参数访问失败
    // ------------------------------------------------
    class BadRequestError final : public Error {
    public:
        using Error::Error;
    };

} // namespace meridian

#endif //MERIDIAN_EXCEPTIONS_HPP
