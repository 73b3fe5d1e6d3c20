#ifndef MERIDIAN_RESPONSE_FACTORY_HPP
#define MERIDIAN_RESPONSE_FACTORY_HPP

#include <string>
#include <string_view>

#include <boost/json/value.hpp>

#include <meridian/http/http_common_types.hpp>

namespace meridian {

    namespace response {

        /// text/html 响应
        HttpResponse html(std::string body, http::status status = http::status::ok);

        /// text/plain 响应
        HttpResponse text(std::string body, http::status status = http::status::ok);

        /// application/json 响应，body 为 boost::json::serialize 的结果
        HttpResponse json(const boost::json::value& body, http::status status = http::status::ok);

        /// 无 body 的响应，默认 204
        HttpResponse empty(http::status status = http::status::no_content);

        /// 带 Location 头的重定向响应
        HttpResponse redirect(std::string_view location, unsigned status = 302);

    } // namespace response

    /**
     * @class ResponseBuilder
     * @brief handler 声明 response 参数时注入的可变响应，最后通过 build() 交给规范化流程。
     */
    class ResponseBuilder {
    public:
        ResponseBuilder();

        ResponseBuilder& status(http::status status);
        ResponseBuilder& header(std::string_view name, std::string_view value);
        ResponseBuilder& body(std::string body, std::string_view content_type = "text/html; charset=UTF-8");
        ResponseBuilder& json(const boost::json::value& body);

        HttpResponse& raw() { return response_; }

        HttpResponse build() const;

    private:
        HttpResponse response_;
    };

} // namespace meridian

#endif //MERIDIAN_RESPONSE_FACTORY_HPP
