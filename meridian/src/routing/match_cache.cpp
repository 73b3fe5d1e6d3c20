#include <meridian/routing/match_cache.hpp>
#include <meridian/routing/method.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace meridian {

    MatchCache::MatchCache(const size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {
    }

    std::string MatchCache::make_key(const http::verb method, const std::string_view path, const std::string_view host, const std::string_view scheme) {
        // scheme 与 host 带长度前缀，"h/admin" + "/secret" 与 "h" + "/admin/secret" 不会拼出同一个键
        return fmt::format("{} {}:{}{}:{}{}", method_name(method), scheme.size(), scheme, host.size(), host, path);
    }

    const Route* MatchCache::find(const http::verb method, const std::string_view path, const std::string_view host, const std::string_view scheme) const {
        std::lock_guard lock(mutex_);
        if (!enabled_) return nullptr;
        const auto it = entries_.find(make_key(method, path, host, scheme));
        return it == entries_.end() ? nullptr : it->second;
    }

    void MatchCache::insert(const http::verb method, const std::string_view path, const std::string_view host, const std::string_view scheme, const Route* route) {
        std::lock_guard lock(mutex_);
        if (!enabled_) return;

        std::string key = make_key(method, path, host, scheme);
        if (const auto it = entries_.find(key); it != entries_.end()) {
            it->second = route;
            return;
        }

        if (entries_.size() >= capacity_) {
            SPDLOG_TRACE("Match cache full ({}), evicting '{}'", capacity_, insertion_order_.front());
            entries_.erase(insertion_order_.front());
            insertion_order_.pop_front();
        }
        entries_.emplace(key, route);
        insertion_order_.push_back(std::move(key));
    }

    void MatchCache::clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
        insertion_order_.clear();
    }

    size_t MatchCache::size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    void MatchCache::set_enabled(const bool enabled) {
        std::lock_guard lock(mutex_);
        enabled_ = enabled;
        if (!enabled_) {
            entries_.clear();
            insertion_order_.clear();
        }
    }

} // namespace meridian
