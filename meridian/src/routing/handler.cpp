#include <meridian/routing/handler.hpp>

namespace meridian {

    HandlerRef::HandlerRef(const std::string& descriptor) {
        if (const auto at = descriptor.find('@'); at != std::string::npos) {
            storage_ = ControllerAction{descriptor.substr(0, at), descriptor.substr(at + 1)};
        } else {
            storage_ = InvokableTarget{descriptor};
        }
    }

    std::string HandlerRef::target() const {
        if (const auto* a = std::get_if<ControllerAction>(&storage_)) return a->target;
        if (const auto* t = std::get_if<InvokableTarget>(&storage_)) return t->target;
        return {};
    }

    std::string HandlerRef::method() const {
        if (const auto* a = std::get_if<ControllerAction>(&storage_)) return a->method;
        if (std::holds_alternative<InvokableTarget>(storage_)) return std::string(kInvokeMethod);
        return {};
    }

    std::string HandlerRef::describe() const {
        if (const auto* a = std::get_if<ControllerAction>(&storage_)) return a->target + "@" + a->method;
        if (const auto* t = std::get_if<InvokableTarget>(&storage_)) return t->target;
        return "Closure";
    }

} // namespace meridian
