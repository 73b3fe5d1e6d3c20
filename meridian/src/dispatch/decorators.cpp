#include <meridian/dispatch/decorators.hpp>
#include <meridian/dispatch/response_normalizer.hpp>

namespace meridian::decorators {

    Decorator with_header(std::string name, std::string value) {
        return [name = std::move(name), value = std::move(value)](Action inner) {
            auto invoke = [inner = inner.invoke, name, value](Arguments& args) -> HandlerResult {
                HttpResponse res = normalize_response(inner(args));
                res.set(name, value);
                return res;
            };
            return Action(std::move(inner.parameters), std::move(invoke));
        };
    }

    Decorator cache_control(const unsigned seconds) {
        return with_header("Cache-Control", "public, max-age=" + std::to_string(seconds));
    }

    Action apply(Action action, const std::vector<Decorator>& decorators) {
        for (const auto& decorate : decorators) {
            action = decorate(std::move(action));
        }
        return action;
    }

} // namespace meridian::decorators
