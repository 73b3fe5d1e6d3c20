#include <meridian/dispatch/argument_resolver.hpp>
#include <meridian/dispatch/type_coercion.hpp>
#include <meridian/error/exceptions.hpp>
#include <meridian/http/request_context.hpp>
#include <meridian/http/response_factory.hpp>
#include <meridian/routing/route.hpp>

#include <functional>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace meridian {

    namespace {
        template<typename Map>
        std::vector<std::string> keys_of(const Map& map) {
            std::vector<std::string> keys;
            for (const auto& [key, value] : map) keys.emplace_back(key);
            return keys;
        }
    }

    Arguments ArgumentResolver::resolve(const std::vector<ParamDescriptor>& parameters, RequestContext& ctx) const {
        std::vector<std::string> names;
        std::vector<ArgumentValue> values;
        names.reserve(parameters.size());
        values.reserve(parameters.size());

        // 已经绑定到具名参数的路由参数，可变参数不再收集
        std::set<std::string, std::less<>> consumed;

        for (size_t position = 0; position < parameters.size(); ++position) {
            const ParamDescriptor& param = parameters[position];
            names.push_back(param.name);

            if (param.variadic) {
                std::vector<std::string> rest;
                if (ctx.route()) {
                    for (const auto& key : ctx.route()->parameter_names()) {
                        if (consumed.contains(key)) continue;
                        if (const auto value = ctx.pathParam(key)) rest.emplace_back(*value);
                    }
                }
                values.emplace_back(std::move(rest));
                continue;
            }

            // a. 框架类型
            if (param.type == ParamType::request) {
                values.emplace_back(ObjectArg{std::ref(ctx.request())});
                continue;
            }
            if (param.type == ParamType::response) {
                values.emplace_back(ObjectArg{std::make_shared<ResponseBuilder>()});
                continue;
            }
            if (param.type == ParamType::context) {
                values.emplace_back(ObjectArg{std::ref(ctx)});
                continue;
            }

            // b. 容器解析的对象类型；c ~ g. 按名字查找
            std::optional<ArgumentValue> value = param.type == ParamType::object
                                                     ? resolve_object(param, ctx, consumed)
                                                     : resolve_by_name(param, ctx, consumed);
            if (value) {
                values.push_back(std::move(*value));
                continue;
            }

            // h. 默认值
            if (param.default_value) {
                values.push_back(*param.default_value);
                continue;
            }

            // i. 可空
            if (param.nullable) {
                values.emplace_back(std::monostate{});
                continue;
            }

            UnresolvableParameter error(param.name, position, available_sources(ctx));
            SPDLOG_WARN("{} (route: {})", error.what(), ctx.route() ? ctx.route()->path() : std::string("-"));
            throw error;
        }

        return {ctx, std::move(names), std::move(values)};
    }

    std::optional<ArgumentValue> ArgumentResolver::resolve_object(const ParamDescriptor& param, RequestContext& ctx,
                                                                  std::set<std::string, std::less<>>& consumed) const {
        if (!container_.has(param.type_name)) {
            return std::nullopt;
        }
        Resolution resolution = container_.resolve(param.type_name);

        // 模型绑定：用同名路由参数查找记录
        if (resolution.repository) {
            const auto raw = ctx.pathParam(param.name);
            if (!raw) {
                return std::nullopt;
            }
            std::string field = resolution.repository->primary_key();
            if (ctx.route()) {
                const auto& fields = ctx.route()->binding_fields();
                if (const auto it = fields.find(param.name); it != fields.end()) {
                    field = it->second;
                }
            }

            consumed.insert(param.name);
            auto record = resolution.repository->find(field, *raw);
            if (!record) {
                SPDLOG_DEBUG("Model binding for '{}' found nothing where {} = {}", param.type_name, field, *raw);
                throw ModelNotFound(param.type_name, field, std::string(*raw));
            }
            return ArgumentValue(ObjectArg{std::move(*record)});
        }

        // 自动校验的输入对象：校验失败时 ValidationFailed 直接向上抛
        if (resolution.input) {
            resolution.input->validate(ctx);
        }
        return ArgumentValue(ObjectArg{std::move(resolution.instance)});
    }

    std::optional<ArgumentValue> ArgumentResolver::resolve_by_name(const ParamDescriptor& param, RequestContext& ctx,
                                                                   std::set<std::string, std::less<>>& consumed) const {
        // c. 路由参数
        if (const auto raw = ctx.pathParam(param.name)) {
            consumed.insert(param.name);
            return coercion::coerce(param, *raw);
        }

        const ServerRequest& request = ctx.request();

        // d. 请求属性
        if (const auto raw = request.attribute(param.name)) {
            return coercion::coerce(param, *raw);
        }

        // e. 查询参数
        if (const auto& query = request.query_all(); query.contains(param.name)) {
            return coercion::coerce(param, request.query_list(param.name));
        }

        // f. body 字段
        if (const auto& body = request.input_all(); body.contains(param.name)) {
            return coercion::coerce(param, request.input_list(param.name));
        }

        // g. 上传文件
        if (const UploadedFile* file = request.file(param.name)) {
            return ArgumentValue(ObjectArg{*file});
        }

        return std::nullopt;
    }

    std::vector<std::string> ArgumentResolver::available_sources(const RequestContext& ctx) {
        std::vector<std::string> sources;
        auto add = [&sources](const std::string_view label, const std::vector<std::string>& keys) {
            if (!keys.empty()) sources.push_back(fmt::format("{}({})", label, fmt::join(keys, ", ")));
        };

        add("route", keys_of(ctx.pathParams()));
        add("attributes", keys_of(ctx.request().attributes()));
        add("query", keys_of(ctx.request().query_all()));
        add("body", keys_of(ctx.request().input_all()));
        add("files", keys_of(ctx.request().files()));
        return sources;
    }

} // namespace meridian
