#include <meridian/routing/method.hpp>
#include <meridian/error/exceptions.hpp>

#include <algorithm>
#include <cctype>

namespace meridian {

    http::verb parse_method(const std::string_view method) {
        std::string upper(method);
        std::ranges::transform(upper, upper.begin(), [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });

        const http::verb verb = http::string_to_verb(upper);
        if (std::ranges::find(kRoutableMethods, verb) == kRoutableMethods.end()) {
            throw InvalidMethod(std::string(method));
        }
        return verb;
    }

    std::string_view method_name(const http::verb method) {
        const auto sv = http::to_string(method);
        return {sv.data(), sv.size()};
    }

    std::string join_methods(const std::vector<http::verb>& methods) {
        std::string out;
        for (size_t i = 0; i < methods.size(); ++i) {
            out += method_name(methods[i]);
            if (i < methods.size() - 1) out += ", ";
        }
        return out;
    }

} // namespace meridian
