#ifndef MERIDIAN_MATCH_CACHE_HPP
#define MERIDIAN_MATCH_CACHE_HPP

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <meridian/http/http_common_types.hpp>

namespace meridian {

    class Route;

    /**
     * @class MatchCache
     * @brief (有效方法, 路径, 主机, 协议) -> Route 的有界缓存。
     *
     * 容量满时淘汰最早插入的一条（FIFO，不是 LRU，命中不会刷新位置）。
     * 分发阶段每次未命中都会写入，多线程分发时由内部互斥锁保护。
     */
    class MatchCache {
    public:
        static constexpr size_t kDefaultCapacity = 1000;

        explicit MatchCache(size_t capacity = kDefaultCapacity);

        const Route* find(http::verb method, std::string_view path, std::string_view host, std::string_view scheme) const;

        void insert(http::verb method, std::string_view path, std::string_view host, std::string_view scheme, const Route* route);

        void clear();

        size_t size() const;
        size_t capacity() const { return capacity_; }

        bool enabled() const { return enabled_; }
        /// 关闭时 find 永远未命中，insert 不做任何事
        void set_enabled(bool enabled);

    private:
        static std::string make_key(http::verb method, std::string_view path, std::string_view host, std::string_view scheme);

        mutable std::mutex mutex_;
        size_t capacity_;
        bool enabled_ = true;
        std::unordered_map<std::string, const Route*> entries_;
        std::deque<std::string> insertion_order_;
    };

} // namespace meridian

#endif //MERIDIAN_MATCH_CACHE_HPP
