#include <meridian/container/container.hpp>
#include <meridian/error/exceptions.hpp>

#include <spdlog/spdlog.h>

namespace meridian {

    void ServiceContainer::forget(const std::string_view type) {
        if (const auto it = bindings_.find(type); it != bindings_.end()) {
            bindings_.erase(it);
        }
    }

    bool ServiceContainer::has(const std::string_view type) const {
        return bindings_.find(type) != bindings_.end();
    }

    Resolution ServiceContainer::resolve(const std::string_view type) {
        const auto it = bindings_.find(type);
        if (it == bindings_.end()) {
            SPDLOG_WARN("Container has no binding for '{}'", type);
            throw MissingTarget(std::string(type));
        }
        return it->second();
    }

} // namespace meridian
