#ifndef BOOKSHELF_STORE_BOOK_REQUEST_HPP
#define BOOKSHELF_STORE_BOOK_REQUEST_HPP

#include <string>

#include <meridian/container/container.hpp>
#include <meridian/error/exceptions.hpp>
#include <meridian/http/request_context.hpp>

namespace bookshelf {

    /// POST /books 的输入，注入前自动校验
    class StoreBookRequest final : public meridian::ValidatedInput {
    public:
        void validate(const meridian::RequestContext& ctx) override {
            std::map<std::string, std::vector<std::string>> errors;
            const auto title = ctx.request().input("title");
            const auto author = ctx.request().input("author");
            if (!title || title->empty()) errors["title"].emplace_back("The title field is required.");
            if (!author || author->empty()) errors["author"].emplace_back("The author field is required.");
            if (!errors.empty()) {
                throw meridian::ValidationFailed(std::move(errors));
            }
            title_ = std::string(*title);
            author_ = std::string(*author);
        }

        const std::string& title() const { return title_; }
        const std::string& author() const { return author_; }

    private:
        std::string title_;
        std::string author_;
    };

} // namespace bookshelf

#endif //BOOKSHELF_STORE_BOOK_REQUEST_HPP
