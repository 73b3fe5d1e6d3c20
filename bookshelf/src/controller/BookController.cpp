#include "BookController.hpp"

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include <meridian/http/request_context.hpp>
#include <meridian/http/response_factory.hpp>

#include "model/StoreBookRequest.hpp"

namespace bookshelf {

    using namespace meridian;

    BookController::BookController(std::shared_ptr<BookRepository> books)
        : books_(std::move(books)) {
        action("index", {{}, [this](Arguments& args) { return index(args); }});
        action("show", {{param::object("book", "Book")}, [this](Arguments& args) { return show(args); }});
        action("store", {{param::object("input", "StoreBookRequest"), param::response()},
                         [this](Arguments& args) { return store(args); }});
        action("update", {{param::object("book", "Book"),
                           param::string("title").with_default(std::string{}),
                           param::string("author").with_default(std::string{})},
                          [this](Arguments& args) { return update(args); }});
        action("destroy", {{param::object("book", "Book")}, [this](Arguments& args) { return destroy(args); }});
        action("search", {{param::string("q"), param::integer("limit").with_default(std::int64_t{10})},
                          [this](Arguments& args) { return search(args); }});
    }

    void BookController::registerRoutes(Router& router) {
        router.GET("/books/search", "BookController@search").name("books.search");
        router.GET("/books/by-slug/{book:slug}", "BookController@show").name("books.by_slug");

        // 读操作公开
        router.resource("books", "BookController", {.only = {"index", "show"}, .parameter = "book"});

        // 写操作需要 api.token
        router.middleware("api.token").group([](Router& r) {
            r.resource("books", "BookController", {.only = {"store", "update", "destroy"}, .parameter = "book"});
        });
    }

    HandlerResult BookController::index(Arguments&) const {
        return boost::json::value_from(books_->all());
    }

    HandlerResult BookController::show(Arguments& args) const {
        const auto book = args.value<Book>("book");
        return boost::json::value_from(*book);
    }

    HandlerResult BookController::store(Arguments& args) const {
        const auto input = args.object<StoreBookRequest>("input");
        const auto response = args.object<ResponseBuilder>("response");
        const Book book = books_->create(input->title(), input->author());
        SPDLOG_INFO("Book {} created by {}", book.id, args.context().request().attribute("caller").value_or("-"));
        return response->status(http::status::created).json(boost::json::value_from(book)).build();
    }

    HandlerResult BookController::update(Arguments& args) const {
        const auto book = args.value<Book>("book");
        books_->update(book->id, args.get<std::string>("title"), args.get<std::string>("author"));
        return true;
    }

    HandlerResult BookController::destroy(Arguments& args) const {
        const auto book = args.value<Book>("book");
        books_->remove(book->id);
        return nullptr;
    }

    HandlerResult BookController::search(Arguments& args) const {
        const auto q = args.get<std::string>("q");
        const auto limit = args.get<std::int64_t>("limit");
        boost::json::array found;
        for (const Book& book : books_->all()) {
            if (static_cast<std::int64_t>(found.size()) >= limit) break;
            if (book.title.find(q) != std::string::npos || book.author.find(q) != std::string::npos) {
                found.push_back(boost::json::value_from(book));
            }
        }
        return found;
    }

} // namespace bookshelf
