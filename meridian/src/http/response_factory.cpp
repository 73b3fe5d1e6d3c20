#include <meridian/http/response_factory.hpp>
#include <meridian/version.hpp>

#include <boost/json/serialize.hpp>

namespace meridian {

    namespace {
        HttpResponse make(const http::status status, std::string body, const std::string_view content_type) {
            HttpResponse res{status, 11};
            res.set(http::field::server, std::string(framework::name) + "/" + std::string(framework::version));
            if (!content_type.empty()) {
                res.set(http::field::content_type, content_type);
            }
            res.body() = std::move(body);
            res.prepare_payload();
            return res;
        }
    }

    namespace response {

        HttpResponse html(std::string body, const http::status status) {
            return make(status, std::move(body), "text/html; charset=UTF-8");
        }

        HttpResponse text(std::string body, const http::status status) {
            return make(status, std::move(body), "text/plain; charset=UTF-8");
        }

        HttpResponse json(const boost::json::value& body, const http::status status) {
            return make(status, boost::json::serialize(body), "application/json;charset=UTF-8");
        }

        HttpResponse empty(const http::status status) {
            return make(status, {}, {});
        }

        HttpResponse redirect(const std::string_view location, const unsigned status) {
            HttpResponse res = make(static_cast<http::status>(status), {}, {});
            res.set(http::field::location, location);
            return res;
        }

    } // namespace response

    ResponseBuilder::ResponseBuilder() : response_(response::html({})) {}

    ResponseBuilder& ResponseBuilder::status(const http::status status) {
        response_.result(status);
        return *this;
    }

    ResponseBuilder& ResponseBuilder::header(const std::string_view name, const std::string_view value) {
        response_.set(name, value);
        return *this;
    }

    ResponseBuilder& ResponseBuilder::body(std::string body, const std::string_view content_type) {
        response_.set(http::field::content_type, content_type);
        response_.body() = std::move(body);
        return *this;
    }

    ResponseBuilder& ResponseBuilder::json(const boost::json::value& body) {
        return this->body(boost::json::serialize(body), "application/json;charset=UTF-8");
    }

    HttpResponse ResponseBuilder::build() const {
        HttpResponse res = response_;
        res.prepare_payload();
        return res;
    }

} // namespace meridian
