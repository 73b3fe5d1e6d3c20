#ifndef BOOKSHELF_BOOK_CONTROLLER_HPP
#define BOOKSHELF_BOOK_CONTROLLER_HPP

#include <memory>

#include <meridian/controller/HttpController.hpp>
#include <meridian/routing/router.hpp>

#include "model/BookRepository.hpp"

namespace bookshelf {

    class BookController final : public meridian::HttpController {
    public:
        explicit BookController(std::shared_ptr<BookRepository> books);

        void registerRoutes(meridian::Router& router) override;

    private:
        meridian::HandlerResult index(meridian::Arguments& args) const;
        meridian::HandlerResult show(meridian::Arguments& args) const;
        meridian::HandlerResult store(meridian::Arguments& args) const;
        meridian::HandlerResult update(meridian::Arguments& args) const;
        meridian::HandlerResult destroy(meridian::Arguments& args) const;
        meridian::HandlerResult search(meridian::Arguments& args) const;

        std::shared_ptr<BookRepository> books_;
    };

} // namespace bookshelf

#endif //BOOKSHELF_BOOK_CONTROLLER_HPP
