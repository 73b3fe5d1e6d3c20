#ifndef MERIDIAN_SERVER_REQUEST_HPP
#define MERIDIAN_SERVER_REQUEST_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <meridian/http/http_common_types.hpp>

namespace meridian {

    /// 上传文件，由传输层（或测试）填入请求
    struct UploadedFile {
        std::string filename;
        std::string content_type;
        std::string content;

        size_t size() const { return content.size(); }
    };

    /**
     * @class ServerRequest
     * @brief 路由核心使用的请求抽象：Beast 请求 + 传输层补充的信息（协议、对端 IP）。
     *
     * 查询字符串与 body 字段都在第一次访问时才解析。
     */
    class ServerRequest {
    public:
        using FieldMap = std::unordered_map<std::string, std::vector<std::string>, StringHash, StringEqual>;

        explicit ServerRequest(HttpRequest request, std::string scheme = "http", std::string ip = {});

        const HttpRequest& raw() const { return request_; }
        HttpRequest& raw() { return request_; }

        http::verb method() const { return request_.method(); }
        std::string_view target() const;

        /// 去掉查询字符串后的路径
        std::string_view path() const;

        /// Host 头（不含端口，小写）
        std::string host() const;

        const std::string& scheme() const { return scheme_; }
        const std::string& ip() const { return ip_; }

        std::optional<std::string_view> header(std::string_view name) const;
        std::optional<std::string_view> header(http::field field) const;

        // --- 查询参数 ---
        std::optional<std::string_view> query(std::string_view key) const;
        std::vector<std::string> query_list(std::string_view key) const;
        const FieldMap& query_all() const;

        // --- body 字段（form-urlencoded 或 JSON 对象的顶层字段） ---
        std::optional<std::string_view> input(std::string_view key) const;
        std::vector<std::string> input_list(std::string_view key) const;
        const FieldMap& input_all() const;

        bool is_json() const;

        // --- 上传文件 ---
        void add_file(std::string field, UploadedFile file);
        const UploadedFile* file(std::string_view field) const;
        const std::map<std::string, UploadedFile, std::less<>>& files() const { return files_; }

        // --- 请求属性（中间件写入，参数解析读取） ---
        void set_attribute(std::string key, std::string value);
        std::optional<std::string_view> attribute(std::string_view key) const;
        const std::map<std::string, std::string, std::less<>>& attributes() const { return attributes_; }

    private:
        void parseQueryIfNeeded() const;
        void parseBodyIfNeeded() const;

        static void parseEncodedFields(std::string_view encoded, FieldMap& out);

        HttpRequest request_;
        std::string scheme_;
        std::string ip_;

        std::map<std::string, UploadedFile, std::less<>> files_;
        std::map<std::string, std::string, std::less<>> attributes_;

        mutable FieldMap query_;
        mutable bool queryParsed_ = false;
        mutable FieldMap body_;
        mutable bool bodyParsed_ = false;
    };

} // namespace meridian

#endif //MERIDIAN_SERVER_REQUEST_HPP
