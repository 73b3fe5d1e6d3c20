#ifndef BOOKSHELF_BOOK_REPOSITORY_HPP
#define BOOKSHELF_BOOK_REPOSITORY_HPP

#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include <meridian/container/container.hpp>

#include "Book.hpp"

namespace bookshelf {

    /**
     * @class BookRepository
     * @brief 内存中的图书表。作为 "Book" 注册到容器后，handler 的 Book 参数按路由参数自动绑定。
     */
    class BookRepository final : public meridian::ModelRepository {
    public:
        BookRepository();

        std::optional<std::any> find(std::string_view field, std::string_view value) const override;

        std::vector<Book> all() const;
        Book create(std::string title, std::string author);
        bool update(std::int64_t id, const std::string& title, const std::string& author);
        bool remove(std::int64_t id);

    private:
        mutable std::mutex mutex_;
        std::map<std::int64_t, Book> books_;
        std::int64_t next_id_ = 1;
    };

} // namespace bookshelf

#endif //BOOKSHELF_BOOK_REPOSITORY_HPP
