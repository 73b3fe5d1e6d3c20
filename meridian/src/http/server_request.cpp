#include <meridian/http/server_request.hpp>

#include <algorithm>
#include <cctype>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/url/parse_query.hpp>
#include <boost/url/params_view.hpp>
#include <spdlog/spdlog.h>

namespace meridian {

    namespace {
        bool contains_ci(const std::string_view haystack, const std::string_view needle) {
            return !std::ranges::search(haystack, needle, [](const char a, const char b) {
                return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
            }).empty();
        }

        // JSON 标量按文本存放，嵌套结构保留序列化后的 JSON
        std::string json_to_field(const boost::json::value& v) {
            if (const auto* s = v.if_string()) return std::string(s->data(), s->size());
            if (v.is_null()) return {};
            return boost::json::serialize(v);
        }
    }

    ServerRequest::ServerRequest(HttpRequest request, std::string scheme, std::string ip)
        : request_(std::move(request)),
          scheme_(std::move(scheme)),
          ip_(std::move(ip)) {
        std::ranges::transform(scheme_, scheme_.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    std::string_view ServerRequest::target() const {
        const auto t = request_.target();
        return {t.data(), t.size()};
    }

    std::string_view ServerRequest::path() const {
        const std::string_view t = target();
        const auto pos = t.find('?');
        return pos == std::string_view::npos ? t : t.substr(0, pos);
    }

    std::string ServerRequest::host() const {
        const auto value = header(http::field::host);
        if (!value) return {};

        std::string_view h = *value;
        // IPv6 字面量 "[::1]:8080" 保留方括号内的冒号
        if (h.starts_with('[')) {
            if (const auto close = h.find(']'); close != std::string_view::npos) {
                h = h.substr(0, close + 1);
            }
        } else if (const auto colon = h.rfind(':'); colon != std::string_view::npos) {
            h = h.substr(0, colon);
        }

        std::string out(h);
        std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::optional<std::string_view> ServerRequest::header(const std::string_view name) const {
        const auto it = request_.find(name);
        if (it == request_.end()) return std::nullopt;
        const auto v = it->value();
        return std::string_view(v.data(), v.size());
    }

    std::optional<std::string_view> ServerRequest::header(const http::field field) const {
        const auto it = request_.find(field);
        if (it == request_.end()) return std::nullopt;
        const auto v = it->value();
        return std::string_view(v.data(), v.size());
    }

    // --- 查询参数 ---

    std::optional<std::string_view> ServerRequest::query(const std::string_view key) const {
        parseQueryIfNeeded();
        const auto it = query_.find(key);
        if (it != query_.end() && !it->second.empty()) {
            return it->second.front();
        }
        return std::nullopt;
    }

    std::vector<std::string> ServerRequest::query_list(const std::string_view key) const {
        parseQueryIfNeeded();
        const auto it = query_.find(key);
        return it != query_.end() ? it->second : std::vector<std::string>{};
    }

    const ServerRequest::FieldMap& ServerRequest::query_all() const {
        parseQueryIfNeeded();
        return query_;
    }

    // --- body 字段 ---

    std::optional<std::string_view> ServerRequest::input(const std::string_view key) const {
        parseBodyIfNeeded();
        const auto it = body_.find(key);
        if (it != body_.end() && !it->second.empty()) {
            return it->second.front();
        }
        return std::nullopt;
    }

    std::vector<std::string> ServerRequest::input_list(const std::string_view key) const {
        parseBodyIfNeeded();
        const auto it = body_.find(key);
        return it != body_.end() ? it->second : std::vector<std::string>{};
    }

    const ServerRequest::FieldMap& ServerRequest::input_all() const {
        parseBodyIfNeeded();
        return body_;
    }

    bool ServerRequest::is_json() const {
        const auto ct = header(http::field::content_type);
        return ct && contains_ci(*ct, "json");
    }

    // --- 上传文件与属性 ---

    void ServerRequest::add_file(std::string field, UploadedFile file) {
        files_[std::move(field)] = std::move(file);
    }

    const UploadedFile* ServerRequest::file(const std::string_view field) const {
        const auto it = files_.find(field);
        return it == files_.end() ? nullptr : &it->second;
    }

    void ServerRequest::set_attribute(std::string key, std::string value) {
        attributes_[std::move(key)] = std::move(value);
    }

    std::optional<std::string_view> ServerRequest::attribute(const std::string_view key) const {
        const auto it = attributes_.find(key);
        if (it == attributes_.end()) return std::nullopt;
        return it->second;
    }

    // --- 私有辅助函数实现 ---

    void ServerRequest::parseEncodedFields(const std::string_view encoded, FieldMap& out) {
        if (encoded.empty()) return;

        // 直接 .value() 在解析失败时会抛出，这里显式检查
        auto result = boost::urls::parse_query(encoded);
        if (!result.has_value()) {
            SPDLOG_WARN("Query parse failed: {}", encoded);
            return;
        }

        boost::urls::encoding_opts opts;
        opts.space_as_plus = true;
        const boost::urls::params_view params(result.value(), opts);
        for (const auto& param : params) {
            out[param.key].push_back(param.has_value ? param.value : std::string{});
        }
    }

    void ServerRequest::parseQueryIfNeeded() const {
        if (queryParsed_) return;
        queryParsed_ = true;

        const std::string_view t = target();
        const auto pos = t.find('?');
        if (pos == std::string_view::npos) return;

        parseEncodedFields(t.substr(pos + 1), query_);
    }

    void ServerRequest::parseBodyIfNeeded() const {
        if (bodyParsed_) return;
        bodyParsed_ = true;

        const std::string& body = request_.body();
        if (body.empty()) return;

        if (is_json()) {
            boost::system::error_code ec;
            const boost::json::value doc = boost::json::parse(body, ec);
            if (ec) {
                SPDLOG_WARN("JSON body parse failed: {}", ec.message());
                return;
            }
            if (const auto* obj = doc.if_object()) {
                for (const auto& [key, value] : *obj) {
                    auto& slot = body_[std::string(key)];
                    if (const auto* arr = value.if_array()) {
                        for (const auto& item : *arr) slot.push_back(json_to_field(item));
                    } else {
                        slot.push_back(json_to_field(value));
                    }
                }
            }
            return;
        }

        if (const auto ct = header(http::field::content_type); ct && contains_ci(*ct, "x-www-form-urlencoded")) {
            parseEncodedFields(body, body_);
        }
    }

} // namespace meridian
