#include <meridian/error/exceptions.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace meridian {

    UnresolvableParameter::UnresolvableParameter(std::string name, const std::size_t position, std::vector<std::string> available_sources)
        : ResolutionError(fmt::format("Unable to resolve parameter [{}] at position {}. Available sources: {}",
                                      name, position,
                                      available_sources.empty() ? std::string("none") : fmt::format("{}", fmt::join(available_sources, ", ")))),
          name_(std::move(name)),
          position_(position),
          available_sources_(std::move(available_sources)) {
    }

    MissingRouteParameter::MissingRouteParameter(const std::string& route, std::vector<std::string> missing)
        : Error(fmt::format("Missing required parameter(s) [{}] for route [{}]", fmt::join(missing, ", "), route)),
          missing_(std::move(missing)) {
    }

} // namespace meridian
