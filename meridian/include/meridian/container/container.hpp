#ifndef MERIDIAN_CONTAINER_HPP
#define MERIDIAN_CONTAINER_HPP

#include <any>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <meridian/controller/HttpController.hpp>
#include <meridian/dispatch/middleware.hpp>

namespace meridian {

    class RequestContext;

    /**
     * @class ValidatedInput
     * @brief 自动校验的输入对象：注入 handler 之前先调用 validate。
     */
    class ValidatedInput {
    public:
        virtual ~ValidatedInput() = default;

        /// @throws ValidationFailed
        virtual void validate(const RequestContext& ctx) = 0;
    };

    /**
     * @class ModelRepository
     * @brief 模型绑定的数据来源：按字段查找一条记录。
     */
    class ModelRepository {
    public:
        virtual ~ModelRepository() = default;

        /// 查不到返回 std::nullopt
        virtual std::optional<std::any> find(std::string_view field, std::string_view value) const = 0;

        virtual std::string primary_key() const { return "id"; }
    };

    /**
     * @struct Resolution
     * @brief 容器按类型名解析的结果。instance 总是 std::shared_ptr<T>，
     *        其余字段标记该对象属于哪一类特殊处理。
     */
    struct Resolution {
        std::any instance;
        std::shared_ptr<ValidatedInput> input;
        std::shared_ptr<ModelRepository> repository;
        std::shared_ptr<HttpController> controller;
        std::shared_ptr<Middleware> middleware;
    };

    /**
     * @class Container
     * @brief 路由核心消费的容器契约：按类型名解析。对象的构造策略由实现决定。
     */
    class Container {
    public:
        virtual ~Container() = default;

        virtual bool has(std::string_view type) const = 0;

        /// @throws MissingTarget 未注册的类型
        virtual Resolution resolve(std::string_view type) = 0;
    };

    /**
     * @class ServiceContainer
     * @brief 基于工厂函数的简单实现：bind 每次解析都构造新对象，singleton 共享同一个实例。
     */
    class ServiceContainer final : public Container {
    public:
        template<typename T>
        void bind(std::string type, std::function<std::shared_ptr<T>()> factory) {
            bindings_.insert_or_assign(std::move(type), [factory = std::move(factory)] { return make_resolution<T>(factory()); });
        }

        template<typename T>
        void singleton(std::string type, std::shared_ptr<T> instance) {
            bindings_.insert_or_assign(std::move(type), [instance = std::move(instance)] { return make_resolution<T>(instance); });
        }

        /// 模型类型名 -> 仓储
        void bind_model(std::string type, std::shared_ptr<ModelRepository> repository) {
            singleton<ModelRepository>(std::move(type), std::move(repository));
        }

        void forget(std::string_view type);

        bool has(std::string_view type) const override;
        Resolution resolve(std::string_view type) override;

        template<typename T>
        static Resolution make_resolution(std::shared_ptr<T> object) {
            Resolution r;
            if constexpr (std::is_base_of_v<ValidatedInput, T>) r.input = object;
            if constexpr (std::is_base_of_v<ModelRepository, T>) r.repository = object;
            if constexpr (std::is_base_of_v<HttpController, T>) r.controller = object;
            if constexpr (std::is_base_of_v<Middleware, T>) r.middleware = object;
            r.instance = std::move(object);
            return r;
        }

    private:
        std::map<std::string, std::function<Resolution()>, std::less<>> bindings_;
    };

} // namespace meridian

#endif //MERIDIAN_CONTAINER_HPP
