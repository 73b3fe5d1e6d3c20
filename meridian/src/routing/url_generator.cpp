#include <meridian/routing/url_generator.hpp>
#include <meridian/error/exceptions.hpp>
#include <meridian/routing/route.hpp>
#include <meridian/routing/router.hpp>
#include <meridian/utils/string_match.hpp>

#include <set>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>
#include <spdlog/spdlog.h>

namespace meridian {

    namespace {
        /**
         * 用参数替换模板中的占位符。
         * 未提供的可选参数被去掉，并吞掉紧挨在它前面的 '/'；未提供的必填参数记入 missing。
         */
        std::string substitute(const std::string_view tmpl, const RouteParameters& params, const DefaultMap& defaults,
                               std::set<std::string, std::less<>>& used, std::vector<std::string>& missing) {
            std::string out;
            for (const auto& token : RoutePattern::tokenize(tmpl)) {
                if (!token.placeholder) {
                    out += token.literal;
                    continue;
                }

                const Placeholder& ph = *token.placeholder;
                const std::string* value = nullptr;
                if (const auto it = params.find(ph.name); it != params.end()) {
                    value = &it->second;
                    used.insert(ph.name);
                } else if (const auto def = defaults.find(ph.name); def != defaults.end()) {
                    value = &def->second;
                }

                if (value && !value->empty()) {
                    out += *value;
                } else if (ph.optional) {
                    if (out.ends_with('/')) out.pop_back();
                } else {
                    missing.push_back(ph.name);
                }
            }
            return out;
        }
    }

    UrlGenerator::UrlGenerator(const Router& router, AppConfig app)
        : router_(router),
          app_(std::move(app)) {
    }

    std::string UrlGenerator::route(const std::string_view name, const RouteParameters& params, const bool absolute) const {
        const Route* route = router_.route_by_name(name);
        if (!route) {
            const std::string suggestion = suggest(name);
            SPDLOG_DEBUG("URL generation for unknown route '{}'", name);
            throw RouteNotFound(std::string(name), suggestion);
        }
        return generate(*route, params, absolute);
    }

    std::string UrlGenerator::generate(const Route& route, const RouteParameters& params, const bool absolute) const {
        std::set<std::string, std::less<>> used;
        std::vector<std::string> missing;

        std::string path = substitute(route.path(), params, route.defaults(), used, missing);

        std::string host;
        if (absolute && route.domain()) {
            if (route.domain()->find('*') == std::string::npos) {
                host = substitute(*route.domain(), params, route.defaults(), used, missing);
            } else {
                // 通配域名无法还原出具体主机，使用 [app].url 的主机
                SPDLOG_DEBUG("Route domain '{}' is a wildcard, using app host", *route.domain());
            }
        }

        if (!missing.empty()) {
            throw MissingRouteParameter(route.name().value_or(route.path()), std::move(missing));
        }

        if (path.empty()) path = "/";
        if (const std::string base = trim_slashes(app_.base_path); !base.empty()) {
            path = "/" + base + (path == "/" ? "" : path);
        }

        // 其余参数作为查询字符串
        boost::urls::url extra;
        for (const auto& [key, value] : params) {
            if (!used.contains(key)) {
                extra.params().append(boost::urls::param_view(key, value));
            }
        }
        if (extra.has_query()) {
            path += "?";
            path += std::string(extra.encoded_query());
        }

        if (!absolute) {
            return path;
        }

        std::string scheme = route.scheme().value_or("");
        if (scheme.empty() || host.empty()) {
            const auto app_url = boost::urls::parse_uri(app_.url);
            if (!app_url) {
                SPDLOG_WARN("app.url '{}' is not a valid URI, returning a relative URL", app_.url);
                return path;
            }
            if (scheme.empty()) scheme = std::string(app_url->scheme());
            if (host.empty()) host = std::string(app_url->encoded_authority());
        }
        return scheme + "://" + host + path;
    }

    std::string UrlGenerator::suggest(const std::string_view name) const {
        std::string best;
        std::size_t best_distance = 3;
        for (const auto& [candidate, route] : router_.named_routes()) {
            if (const std::size_t d = utils::levenshtein(name, candidate); d < best_distance) {
                best_distance = d;
                best = candidate;
            }
        }
        return best;
    }

} // namespace meridian
