#include <meridian/dispatch/method_override.hpp>
#include <meridian/http/server_request.hpp>
#include <meridian/utils/param_parser.hpp>

#include <optional>
#include <spdlog/spdlog.h>

namespace meridian {

    namespace {
        std::optional<http::verb> accepted_override(const std::string_view value) {
            if (param_parser::isEquals(value, "PUT")) return http::verb::put;
            if (param_parser::isEquals(value, "PATCH")) return http::verb::patch;
            if (param_parser::isEquals(value, "DELETE")) return http::verb::delete_;
            return std::nullopt;
        }
    }

    http::verb effective_method(const ServerRequest& request, const bool allow_override) {
        const http::verb method = request.method();

        if (method == http::verb::head) {
            return http::verb::get;
        }
        if (method != http::verb::post || !allow_override) {
            return method;
        }

        std::optional<std::string_view> signal = request.input(kMethodOverrideField);
        if (!signal) signal = request.query(kMethodOverrideField);
        if (!signal) signal = request.header(kMethodOverrideHeader);
        if (!signal) {
            return method;
        }

        if (const auto overridden = accepted_override(*signal)) {
            return *overridden;
        }
        SPDLOG_DEBUG("Ignored method override '{}' on POST {}", *signal, request.path());
        return method;
    }

} // namespace meridian
