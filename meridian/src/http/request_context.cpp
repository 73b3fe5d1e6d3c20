#include <meridian/http/request_context.hpp>
#include <meridian/routing/method.hpp>
#include <meridian/routing/route.hpp>
#include <meridian/utils/string_match.hpp>

#include <algorithm>
#include <cctype>

namespace meridian {

    namespace {
        bool contains_ci(const std::string_view haystack, const std::string_view needle) {
            return !std::ranges::search(haystack, needle, [](const char a, const char b) {
                return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
            }).empty();
        }
    }

    RequestContext::RequestContext(ServerRequest& request, Router& router, std::stop_token stop)
        : request_(request),
          router_(router),
          stop_(std::move(stop)),
          method_(request.method()) {
    }

    void RequestContext::bind(const Route& route, PathParams params, const bool from_cache) {
        route_ = &route;
        path_params_ = std::move(params);
        from_cache_ = from_cache;
    }

    std::optional<std::string_view> RequestContext::pathParam(const std::string_view key) const {
        if (const auto it = path_params_.find(key); it != path_params_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<std::string_view> RequestContext::queryParam(const std::string_view key) const {
        return request_.query(key);
    }

    std::optional<std::string> RequestContext::route_name() const {
        if (!route_) return std::nullopt;
        return route_->name();
    }

    bool RequestContext::route_is(const std::initializer_list<std::string_view> patterns) const {
        const auto name = route_name();
        if (!name) return false;
        return std::ranges::any_of(patterns, [&](const std::string_view p) { return utils::wildcard_match(p, *name); });
    }

    bool RequestContext::route_is(const std::vector<std::string>& patterns) const {
        const auto name = route_name();
        if (!name) return false;
        return std::ranges::any_of(patterns, [&](const std::string& p) { return utils::wildcard_match(p, *name); });
    }

    std::string RequestContext::param(const std::string_view key, const std::string_view fallback) const {
        const auto value = pathParam(key);
        return std::string(value ? *value : fallback);
    }

    bool RequestContext::is_method(const std::string_view method) const {
        return param_parser::isEquals(method_name(method_), method);
    }

    bool RequestContext::wants_json() const {
        if (const auto accept = request_.header(http::field::accept); accept && contains_ci(*accept, "json")) {
            return true;
        }
        return request_.is_json();
    }

    bool RequestContext::is_ajax() const {
        const auto xrw = request_.header("X-Requested-With");
        return xrw && param_parser::isEquals(*xrw, "XMLHttpRequest");
    }

} // namespace meridian
