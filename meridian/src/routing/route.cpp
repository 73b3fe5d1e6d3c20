#include <meridian/routing/route.hpp>
#include <meridian/routing/router.hpp>
#include <meridian/routing/method.hpp>
#include <meridian/error/exceptions.hpp>
#include <meridian/utils/param_parser.hpp>

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace meridian {

    Route::Route(const http::verb method, std::string path, HandlerRef handler,
                 std::vector<MiddlewareRef> middleware, Router* router)
        : router_(router),
          method_(method),
          path_(std::move(path)),
          handler_(std::move(handler)),
          middleware_(std::move(middleware)),
          pattern_(RoutePattern::compile(path_)) {
        // `{param:key}` 形式的占位符记录备用查找字段
        for (const auto& ph : RoutePattern::placeholders(path_)) {
            if (ph.binding_key) binding_fields_[ph.name] = *ph.binding_key;
        }
    }

    Route& Route::middleware(MiddlewareRef middleware) {
        middleware_.push_back(std::move(middleware));
        return *this;
    }

    Route& Route::middleware(const std::vector<MiddlewareRef>& middleware) {
        middleware_.insert(middleware_.end(), middleware.begin(), middleware.end());
        return *this;
    }

    Route& Route::name(const std::string& name) {
        std::string full = name_prefix_ + name;
        if (name_ && *name_ == full) return *this;
        if (router_) {
            router_->register_named_route(full, *this);
            if (name_ && *name_ != full) router_->forget_route_name(*name_);
        }
        name_ = std::move(full);
        return *this;
    }

    Route& Route::where(const std::string& key, const std::string& pattern) {
        wheres_[key] = pattern;
        recompile();
        return *this;
    }

    Route& Route::where(const ConstraintMap& constraints) {
        for (const auto& [key, pattern] : constraints) {
            wheres_[key] = pattern;
        }
        recompile();
        return *this;
    }

    Route& Route::defaults(const std::string& key, const std::string& value) {
        defaults_[key] = value;
        return *this;
    }

    Route& Route::defaults(const DefaultMap& values) {
        for (const auto& [key, value] : values) {
            defaults_[key] = value;
        }
        return *this;
    }

    Route& Route::domain(const std::string& domain) {
        domain_ = domain;
        domain_pattern_ = RoutePattern::compile_domain(domain, wheres_);
        if (router_) router_->clear_match_cache();
        return *this;
    }

    Route& Route::scheme(const std::string& scheme) {
        std::string lower(scheme);
        std::ranges::transform(lower, lower.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower != "http" && lower != "https") {
            SPDLOG_ERROR("Route [{} {}] rejected scheme '{}'", method_name(method_), path_, scheme);
            throw InvalidScheme(scheme);
        }
        scheme_ = std::move(lower);
        if (router_) router_->clear_match_cache();
        return *this;
    }

    Route& Route::meta(const std::string& key, boost::json::value value) {
        meta_[key] = std::move(value);
        return *this;
    }

    Route& Route::bind_field(const std::string& param, const std::string& field) {
        binding_fields_[param] = field;
        return *this;
    }

    Route& Route::decorate(Decorator decorator) {
        decorators_.push_back(std::move(decorator));
        return *this;
    }

    void Route::recompile() {
        pattern_ = RoutePattern::compile(path_, wheres_);
        if (domain_) {
            domain_pattern_ = RoutePattern::compile_domain(*domain_, wheres_);
        }
        // 约束变化后，缓存中指向本路由的结果可能已失效
        if (router_) router_->clear_match_cache();
        SPDLOG_TRACE("Recompiled route [{} {}] -> {}", method_name(method_), path_, pattern_.regex_source());
    }

    bool Route::matches_host_and_scheme(const std::string_view host, const std::string_view scheme) const {
        if (domain_pattern_ && !domain_pattern_->match(host)) {
            return false;
        }
        if (scheme_ && !param_parser::isEquals(*scheme_, scheme)) {
            return false;
        }
        return true;
    }

    bool Route::matches(const http::verb method, const std::string_view path, const std::string_view host, const std::string_view scheme) const {
        if (method != method_) return false;
        return matches_ignoring_method(path, host, scheme);
    }

    bool Route::matches_ignoring_method(const std::string_view path, const std::string_view host, const std::string_view scheme) const {
        if (!matches_host_and_scheme(host, scheme)) return false;
        return pattern_.match(path).has_value();
    }

    PathParams Route::extract_parameters(const std::string_view path) const {
        auto matched = pattern_.match(path);
        PathParams params = matched ? std::move(*matched) : PathParams{};

        for (const auto& ph : RoutePattern::placeholders(path_)) {
            if (!ph.optional) continue;
            const auto it = params.find(ph.name);
            if (it != params.end() && !it->second.empty()) continue;

            if (const auto def = defaults_.find(ph.name); def != defaults_.end()) {
                params[ph.name] = def->second;
            }
        }
        return params;
    }

    PathParams Route::extract_domain_parameters(const std::string_view host) const {
        if (!domain_pattern_) return {};
        auto matched = domain_pattern_->match(host);
        return matched ? std::move(*matched) : PathParams{};
    }

    std::vector<std::string> Route::parameter_names() const {
        std::vector<std::string> names;
        if (domain_pattern_) {
            names = domain_pattern_->parameter_names();
        }
        const auto& path_names = pattern_.parameter_names();
        names.insert(names.end(), path_names.begin(), path_names.end());
        return names;
    }

    bool Route::has_inline_parts() const {
        if (handler_.is_inline() || !decorators_.empty()) return true;
        return std::ranges::any_of(middleware_, [](const MiddlewareRef& m) {
            return std::holds_alternative<std::shared_ptr<Middleware>>(m);
        });
    }

} // namespace meridian
