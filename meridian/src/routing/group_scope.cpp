#include <meridian/routing/group_scope.hpp>

namespace meridian {

    std::string trim_slashes(std::string_view sv) {
        while (!sv.empty() && sv.front() == '/') sv.remove_prefix(1);
        while (!sv.empty() && sv.back() == '/') sv.remove_suffix(1);
        return std::string(sv);
    }

    GroupFrame GroupFrame::merged(const GroupAttributes& attributes) const {
        GroupFrame next = *this;

        if (attributes.prefix) {
            if (const std::string p = trim_slashes(*attributes.prefix); !p.empty()) {
                next.prefix = prefix + "/" + p;
            }
        }

        next.middleware.insert(next.middleware.end(), attributes.middleware.begin(), attributes.middleware.end());

        if (attributes.name_space) next.name_space = *attributes.name_space;
        if (attributes.domain) next.domain = *attributes.domain;

        for (const auto& [key, pattern] : attributes.where) {
            next.where[key] = pattern;
        }

        if (attributes.as) next.name_prefix = name_prefix + *attributes.as;

        return next;
    }

} // namespace meridian
