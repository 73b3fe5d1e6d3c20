#ifndef MERIDIAN_HANDLER_HPP
#define MERIDIAN_HANDLER_HPP

#include <any>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/json/value.hpp>

#include <meridian/error/exceptions.hpp>
#include <meridian/http/http_common_types.hpp>

namespace meridian {

    class RequestContext;
    class ServerRequest;

    /// 可以转换为字符串的返回值（对应 “stringable object”）
    class Stringable {
    public:
        virtual ~Stringable() = default;
        virtual std::string to_string() const = 0;
    };

    /**
     * @class HandlerResult
     * @brief handler 的返回值，由 ResponseNormalizer 统一转换为 HttpResponse。
     *
     * - HttpResponse              原样返回
     * - std::string / const char* HTML 响应
     * - boost::json::value        对象/数组 -> JSON 响应
     * - 空（默认构造 / nullptr）  204
     * - bool                      JSON {"success": bool}
     * - 整数 / 浮点               HTML 响应，内容为数字文本
     * - Stringable                HTML 响应
     * - opaque(std::any)          其他任意类型，规范化时抛出 InvalidHandlerReturn
     */
    class HandlerResult {
    public:
        struct Opaque {
            std::any value;
        };

        using Storage = std::variant<std::monostate, HttpResponse, std::string, boost::json::value, bool,
                                     std::int64_t, double, std::shared_ptr<const Stringable>, Opaque>;

        HandlerResult() = default;
        HandlerResult(std::nullptr_t) {}
        HandlerResult(HttpResponse response) : storage_(std::move(response)) {}
        HandlerResult(std::string text) : storage_(std::move(text)) {}
        HandlerResult(const char* text) : storage_(std::string(text)) {}
        HandlerResult(std::string_view text) : storage_(std::string(text)) {}
        HandlerResult(boost::json::value json) : storage_(std::move(json)) {}
        HandlerResult(boost::json::object json) : storage_(boost::json::value(std::move(json))) {}
        HandlerResult(boost::json::array json) : storage_(boost::json::value(std::move(json))) {}
        HandlerResult(bool flag) : storage_(flag) {}

        template<std::integral I> requires (!std::same_as<I, bool>)
        HandlerResult(I number) : storage_(static_cast<std::int64_t>(number)) {}

        HandlerResult(double number) : storage_(number) {}
        HandlerResult(float number) : storage_(static_cast<double>(number)) {}
        HandlerResult(std::shared_ptr<const Stringable> object) : storage_(std::move(object)) {}

        /// 包装任意其他类型的返回值
        static HandlerResult opaque(std::any value) {
            HandlerResult r;
            r.storage_ = Opaque{std::move(value)};
            return r;
        }

        const Storage& storage() const { return storage_; }
        Storage& storage() { return storage_; }

    private:
        Storage storage_;
    };


    /// 非标量参数（服务、模型、请求对象、枚举值等）
    struct ObjectArg {
        std::any value;
    };

    using ArgumentValue = std::variant<std::monostate, std::int64_t, double, bool, std::string,
                                       std::vector<std::string>, ObjectArg>;

    enum class ParamType {
        request,    // 当前 ServerRequest
        response,   // 一个新的 ResponseBuilder
        context,    // 当前 RequestContext
        object,     // 通过容器按类型名解析
        integer,
        floating,
        boolean,
        string,
        array,
        enumeration,
        mixed,      // 未声明类型，按原始字符串传入
    };

    /**
     * @struct ParamDescriptor
     * @brief handler 单个参数的静态描述，注册时构建一次，分发时按顺序解析。
     */
    struct ParamDescriptor {
        std::string name;
        ParamType type = ParamType::mixed;
        std::string type_name;                      // object 类型在容器中的名字
        bool nullable = false;
        std::optional<ArgumentValue> default_value;
        bool variadic = false;
        /// 枚举：按值查找，查不到时回退为原始字符串
        std::function<std::optional<std::any>(std::string_view)> enum_lookup;

        ParamDescriptor or_null() const {
            ParamDescriptor copy = *this;
            copy.nullable = true;
            return copy;
        }

        ParamDescriptor with_default(ArgumentValue value) const {
            ParamDescriptor copy = *this;
            copy.default_value = std::move(value);
            return copy;
        }
    };

    namespace param {
        inline ParamDescriptor request(std::string name = "request") { return {.name = std::move(name), .type = ParamType::request}; }
        inline ParamDescriptor response(std::string name = "response") { return {.name = std::move(name), .type = ParamType::response}; }
        inline ParamDescriptor context(std::string name = "context") { return {.name = std::move(name), .type = ParamType::context}; }
        inline ParamDescriptor integer(std::string name) { return {.name = std::move(name), .type = ParamType::integer}; }
        inline ParamDescriptor floating(std::string name) { return {.name = std::move(name), .type = ParamType::floating}; }
        inline ParamDescriptor boolean(std::string name) { return {.name = std::move(name), .type = ParamType::boolean}; }
        inline ParamDescriptor string(std::string name) { return {.name = std::move(name), .type = ParamType::string}; }
        inline ParamDescriptor array(std::string name) { return {.name = std::move(name), .type = ParamType::array}; }
        inline ParamDescriptor mixed(std::string name) { return {.name = std::move(name), .type = ParamType::mixed}; }

        inline ParamDescriptor object(std::string name, std::string type_name) {
            return {.name = std::move(name), .type = ParamType::object, .type_name = std::move(type_name)};
        }

        /// 收集所有未被前面具名参数消费的路由参数
        inline ParamDescriptor variadic(std::string name) {
            return {.name = std::move(name), .type = ParamType::array, .variadic = true};
        }

        template<typename E>
        ParamDescriptor enumeration(std::string name, std::vector<std::pair<std::string, E>> cases) {
            ParamDescriptor d{.name = std::move(name), .type = ParamType::enumeration, .type_name = "enum"};
            d.enum_lookup = [cases = std::move(cases)](std::string_view raw) -> std::optional<std::any> {
                for (const auto& [value, e] : cases) {
                    if (value == raw) return std::any(e);
                }
                return std::nullopt;
            };
            return d;
        }
    } // namespace param


    /**
     * @class Arguments
     * @brief 解析完成的 handler 实参，按声明顺序排列。
     */
    class Arguments {
    public:
        Arguments(RequestContext& context, std::vector<std::string> names, std::vector<ArgumentValue> values)
            : context_(context), names_(std::move(names)), values_(std::move(values)) {}

        size_t size() const { return values_.size(); }

        RequestContext& context() const { return context_; }

        const ArgumentValue& at(size_t i) const { return values_.at(i); }

        const ArgumentValue& at(std::string_view name) const {
            for (size_t i = 0; i < names_.size(); ++i) {
                if (names_[i] == name) return values_[i];
            }
            throw BadRequestError("Unknown argument: " + std::string(name));
        }

        bool is_null(size_t i) const { return std::holds_alternative<std::monostate>(values_.at(i)); }

        /// 读取标量实参（int64 / double / bool / string / vector<string>）
        template<typename T, typename Key>
        T get(const Key& key) const {
            const ArgumentValue& v = at(key);
            if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
                if (const auto* p = std::get_if<std::int64_t>(&v)) return static_cast<T>(*p);
            } else {
                if (const auto* p = std::get_if<T>(&v)) return *p;
            }
            throw BadRequestError("Argument has an unexpected type");
        }

        /// 读取容器解析出的服务对象（以 shared_ptr<T> 存放）
        template<typename T, typename Key>
        std::shared_ptr<T> object(const Key& key) const {
            if (const auto* obj = std::get_if<ObjectArg>(&at(key))) {
                if (const auto* p = std::any_cast<std::shared_ptr<T>>(&obj->value)) return *p;
            }
            return nullptr;
        }

        /// 读取按值存放的对象（枚举、模型记录等）
        template<typename T, typename Key>
        std::optional<T> value(const Key& key) const {
            if (const auto* obj = std::get_if<ObjectArg>(&at(key))) {
                if (const auto* p = std::any_cast<T>(&obj->value)) return *p;
            }
            return std::nullopt;
        }

        template<typename Key>
        ServerRequest& request(const Key& key) const {
            if (const auto* obj = std::get_if<ObjectArg>(&at(key))) {
                if (const auto* p = std::any_cast<std::reference_wrapper<ServerRequest>>(&obj->value)) return p->get();
            }
            throw BadRequestError("Argument is not the current request");
        }

    private:
        RequestContext& context_;
        std::vector<std::string> names_;
        std::vector<ArgumentValue> values_;
    };


    using ActionFunc = std::function<HandlerResult(Arguments&)>;

    /**
     * @struct Action
     * @brief 一个可调用的 handler：参数描述列表 + 调用体。
     */
    struct Action {
        std::vector<ParamDescriptor> parameters;
        ActionFunc invoke;

        Action() = default;

        Action(std::vector<ParamDescriptor> params, ActionFunc fn)
            : parameters(std::move(params)), invoke(std::move(fn)) {}

        /// 直接接收 RequestContext 的简单 handler，不需要参数解析
        template<typename F>
            requires std::is_invocable_r_v<HandlerResult, F&, RequestContext&>
        Action(F fn)
            : invoke([fn = std::move(fn)](Arguments& args) mutable -> HandlerResult { return fn(args.context()); }) {}
    };

    /// handler 装饰器：Action -> Action，后应用的包在最外层
    using Decorator = std::function<Action(Action)>;

    /// (TargetType, methodName) 形式的 handler
    struct ControllerAction {
        std::string target;
        std::string method;
    };

    /// 可调用类型（只有一个 invoke 动作的控制器）
    struct InvokableTarget {
        std::string target;
    };

    /**
     * @class HandlerRef
     * @brief 路由 handler 引用：内联函数 | (Target, method) | 可调用类型。
     *
     * 字符串形式："Target@method" 解析为 ControllerAction，"Target" 解析为 InvokableTarget。
     */
    class HandlerRef {
    public:
        using Storage = std::variant<Action, ControllerAction, InvokableTarget>;

        /// 可调用类型在控制器动作表中的方法名
        static constexpr std::string_view kInvokeMethod = "invoke";

        HandlerRef(Action action) : storage_(std::move(action)) {}

        template<typename F>
            requires std::is_invocable_r_v<HandlerResult, F&, RequestContext&>
        HandlerRef(F fn) : storage_(Action(std::move(fn))) {}

        HandlerRef(ControllerAction action) : storage_(std::move(action)) {}
        HandlerRef(InvokableTarget target) : storage_(std::move(target)) {}
        HandlerRef(std::string target, std::string method) : storage_(ControllerAction{std::move(target), std::move(method)}) {}
        HandlerRef(const std::string& descriptor);
        HandlerRef(const char* descriptor) : HandlerRef(std::string(descriptor)) {}

        bool is_inline() const { return std::holds_alternative<Action>(storage_); }

        const Storage& storage() const { return storage_; }
        Storage& storage() { return storage_; }

        /// 目标类型名（内联函数返回空）
        std::string target() const;

        /// 方法名（内联函数返回空，可调用类型返回 kInvokeMethod）
        std::string method() const;

        /// 便于日志、路由列表展示："Closure" / "Target@method" / "Target"
        std::string describe() const;

    private:
        Storage storage_;
    };

} // namespace meridian

#endif //MERIDIAN_HANDLER_HPP
