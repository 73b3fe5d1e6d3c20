#include <meridian/routing/route_cache.hpp>
#include <meridian/error/exceptions.hpp>
#include <meridian/routing/router.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value_to.hpp>
#include <spdlog/spdlog.h>

namespace meridian {

    namespace json = boost::json;

    namespace {
        template<typename Map>
        json::object to_object(const Map& map) {
            json::object out;
            for (const auto& [key, value] : map) out[key] = value;
            return out;
        }

        std::map<std::string, std::string, std::less<>> to_map(const json::value* node) {
            std::map<std::string, std::string, std::less<>> out;
            if (!node || !node->is_object()) return out;
            for (const auto& [key, value] : node->get_object()) {
                out.emplace(std::string(key), json::value_to<std::string>(value));
            }
            return out;
        }

        std::string string_or(const json::object& obj, const std::string_view key, const std::string_view fallback = {}) {
            if (const auto* v = obj.if_contains(key); v && v->is_string()) {
                return json::value_to<std::string>(*v);
            }
            return std::string(fallback);
        }

        json::object describe(const Route& route) {
            if (route.has_inline_parts()) {
                const std::string label = std::string(method_name(route.method())) + " " + route.path();
                SPDLOG_ERROR("Route {} cannot be cached", label);
                throw UncacheableHandler(label);
            }

            json::array middleware;
            for (const auto& m : route.middleware()) {
                middleware.emplace_back(describe_middleware(m));
            }

            json::object entry;
            entry["method"] = method_name(route.method());
            entry["path"] = route.path();
            entry["handler"] = route.handler().describe();
            entry["middleware"] = std::move(middleware);
            entry["name"] = route.name() ? json::value(*route.name()) : json::value(nullptr);
            entry["wheres"] = to_object(route.wheres());
            entry["defaults"] = to_object(route.defaults());
            entry["domain"] = route.domain() ? json::value(*route.domain()) : json::value(nullptr);
            entry["scheme"] = route.scheme() ? json::value(*route.scheme()) : json::value(nullptr);
            entry["bindings"] = to_object(route.binding_fields());
            entry["meta"] = route.meta();
            return entry;
        }

        std::vector<MiddlewareRef> middleware_of(const json::object& entry) {
            std::vector<MiddlewareRef> out;
            if (const auto* list = entry.if_contains("middleware"); list && list->is_array()) {
                for (const auto& m : list->get_array()) {
                    out.emplace_back(json::value_to<std::string>(m));
                }
            }
            return out;
        }

        // 与定义阶段相同的链式调用顺序恢复路由
        void apply(Route& route, const json::object& entry) {
            if (const auto wheres = to_map(entry.if_contains("wheres")); !wheres.empty()) {
                route.where(wheres);
            }
            if (const auto defaults = to_map(entry.if_contains("defaults")); !defaults.empty()) {
                route.defaults(defaults);
            }
            if (const std::string domain = string_or(entry, "domain"); !domain.empty()) {
                route.domain(domain);
            }
            if (const std::string scheme = string_or(entry, "scheme"); !scheme.empty()) {
                route.scheme(scheme);
            }
            for (const auto& [param, field] : to_map(entry.if_contains("bindings"))) {
                route.bind_field(param, field);
            }
            if (const auto* meta = entry.if_contains("meta"); meta && meta->is_object()) {
                for (const auto& [key, value] : meta->get_object()) {
                    route.meta(std::string(key), value);
                }
            }
            if (const std::string name = string_or(entry, "name"); !name.empty()) {
                route.name(name);
            }
        }
    }

    json::value RouteCache::serialize(const Router& router) {
        json::array routes;
        for (const Route* route : router.routes()) {
            routes.push_back(describe(*route));
        }

        json::object document;
        document["version"] = kFormatVersion;
        document["routes"] = std::move(routes);
        if (const Route* fallback = router.fallback_route()) {
            document["fallback"] = describe(*fallback);
        }
        return document;
    }

    std::size_t RouteCache::restore(Router& router, const json::value& document) {
        const auto* root = document.if_object();
        if (!root) {
            throw std::runtime_error("Route cache document must be a JSON object");
        }
        if (const auto* version = root->if_contains("version"); !version || !version->is_int64() || version->get_int64() != kFormatVersion) {
            throw std::runtime_error("Unsupported route cache format version");
        }

        std::size_t restored = 0;
        if (const auto* routes = root->if_contains("routes"); routes && routes->is_array()) {
            for (const auto& item : routes->get_array()) {
                const auto& entry = item.as_object();
                Route& route = router.add_route(parse_method(string_or(entry, "method")),
                                                string_or(entry, "path", "/"),
                                                HandlerRef(string_or(entry, "handler")),
                                                middleware_of(entry));
                apply(route, entry);
                ++restored;
            }
        }

        if (const auto* fallback = root->if_contains("fallback"); fallback && fallback->is_object()) {
            const auto& entry = fallback->get_object();
            Route& route = router.fallback(HandlerRef(string_or(entry, "handler")));
            route.middleware(middleware_of(entry));
        }

        SPDLOG_INFO("Restored {} routes from cache", restored);
        return restored;
    }

    void RouteCache::save(const Router& router, const std::string& file) {
        const json::value document = serialize(router);

        std::ofstream out(file, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Unable to write route cache file: " + file);
        }
        out << json::serialize(document);
        SPDLOG_INFO("Route cache written to {}", file);
    }

    std::size_t RouteCache::load(Router& router, const std::string& file) {
        std::ifstream in(file);
        if (!in) {
            throw std::runtime_error("Route cache file not found: " + file);
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        boost::system::error_code ec;
        const json::value document = json::parse(buffer.str(), ec);
        if (ec) {
            throw std::runtime_error("Route cache file '" + file + "' is not valid JSON: " + ec.message());
        }
        return restore(router, document);
    }

} // namespace meridian
