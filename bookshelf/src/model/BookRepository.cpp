#include "BookRepository.hpp"

#include <algorithm>
#include <cctype>
#include <meridian/utils/param_parser.hpp>

namespace bookshelf {

    namespace {
        std::string slugify(std::string_view title) {
            std::string slug;
            for (const char c : title) {
                if (std::isalnum(static_cast<unsigned char>(c))) {
                    slug += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                } else if (!slug.empty() && slug.back() != '-') {
                    slug += '-';
                }
            }
            while (!slug.empty() && slug.back() == '-') slug.pop_back();
            return slug;
        }
    }

    BookRepository::BookRepository() {
        create("The C++ Programming Language", "Bjarne Stroustrup");
        create("Effective Modern C++", "Scott Meyers");
    }

    std::optional<std::any> BookRepository::find(std::string_view field, std::string_view value) const {
        std::lock_guard lock(mutex_);
        if (field == "id") {
            const auto id = meridian::param_parser::tryParse<std::int64_t>(value);
            if (!id) return std::nullopt;
            if (const auto it = books_.find(*id); it != books_.end()) return std::any(it->second);
            return std::nullopt;
        }
        if (field == "slug") {
            const auto it = std::ranges::find_if(books_, [value](const auto& entry) { return entry.second.slug == value; });
            if (it != books_.end()) return std::any(it->second);
        }
        return std::nullopt;
    }

    std::vector<Book> BookRepository::all() const {
        std::lock_guard lock(mutex_);
        std::vector<Book> books;
        books.reserve(books_.size());
        for (const auto& [id, book] : books_) books.push_back(book);
        return books;
    }

    Book BookRepository::create(std::string title, std::string author) {
        std::lock_guard lock(mutex_);
        Book book{next_id_++, slugify(title), std::move(title), std::move(author)};
        books_.emplace(book.id, book);
        return book;
    }

    bool BookRepository::update(const std::int64_t id, const std::string& title, const std::string& author) {
        std::lock_guard lock(mutex_);
        const auto it = books_.find(id);
        if (it == books_.end()) return false;
        if (!title.empty()) {
            it->second.title = title;
            it->second.slug = slugify(title);
        }
        if (!author.empty()) it->second.author = author;
        return true;
    }

    bool BookRepository::remove(const std::int64_t id) {
        std::lock_guard lock(mutex_);
        return books_.erase(id) > 0;
    }

} // namespace bookshelf
