#ifndef BOOKSHELF_BOOK_HPP
#define BOOKSHELF_BOOK_HPP

#include <cstdint>
#include <string>

#include <boost/json.hpp>

namespace bookshelf {

    struct Book {
        std::int64_t id = 0;
        std::string slug;
        std::string title;
        std::string author;
    };

    // boost::json::value_from 支持
    inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Book& book) {
        jv = {
            {"id", book.id},
            {"slug", book.slug},
            {"title", book.title},
            {"author", book.author},
        };
    }

} // namespace bookshelf

#endif //BOOKSHELF_BOOK_HPP
