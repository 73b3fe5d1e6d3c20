#include <meridian/dispatch/response_normalizer.hpp>
#include <meridian/error/exceptions.hpp>
#include <meridian/http/response_factory.hpp>

#include <boost/core/demangle.hpp>
#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace meridian {

    namespace {
        template<class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };

        HttpResponse success(const bool flag) {
            boost::json::object body;
            body["success"] = flag;
            return response::json(body);
        }

        HttpResponse from_json(const boost::json::value& value) {
            switch (value.kind()) {
                case boost::json::kind::object:
                case boost::json::kind::array:
                    return response::json(value);
                case boost::json::kind::string: {
                    const auto& s = value.get_string();
                    return response::html(std::string(s.data(), s.size()));
                }
                case boost::json::kind::bool_:
                    return success(value.get_bool());
                case boost::json::kind::null:
                    return response::empty();
                default:
                    // 数字
                    return response::html(boost::json::serialize(value));
            }
        }
    }

    HttpResponse normalize_response(HandlerResult result) {
        return std::visit(overloaded{
            [](std::monostate) { return response::empty(); },
            [](HttpResponse& res) { return std::move(res); },
            [](std::string& text) { return response::html(std::move(text)); },
            [](const boost::json::value& json) { return from_json(json); },
            [](const bool flag) { return success(flag); },
            [](const std::int64_t number) { return response::html(std::to_string(number)); },
            [](const double number) { return response::html(fmt::format("{}", number)); },
            [](const std::shared_ptr<const Stringable>& object) {
                return object ? response::html(object->to_string()) : response::empty();
            },
            [](const HandlerResult::Opaque& opaque) -> HttpResponse {
                const std::string type = boost::core::demangle(opaque.value.type().name());
                SPDLOG_ERROR("Handler returned an unsupported type: {}", type);
                throw InvalidHandlerReturn(type);
            },
        }, result.storage());
    }

} // namespace meridian
