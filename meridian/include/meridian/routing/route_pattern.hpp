#ifndef MERIDIAN_ROUTE_PATTERN_HPP
#define MERIDIAN_ROUTE_PATTERN_HPP

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <meridian/http/http_common_types.hpp>

namespace meridian {

    /**
     * @struct Placeholder
     * @brief 模板中的一个 `{...}` 占位符。
     *
     * 支持的语法：
     * - `{name}`      必填参数
     * - `{name?}`     可选参数
     * - `{name:key}`  必填参数，并把 key 记录为模型绑定时使用的备用查找字段
     */
    struct Placeholder {
        std::string name;
        bool optional = false;
        std::optional<std::string> binding_key;
    };

    /**
     * @struct TemplateToken
     * @brief 模板被切分后的一个片段：字面量或占位符。
     */
    struct TemplateToken {
        std::string literal;                    // 字面量文本（placeholder 为空时有效）
        std::optional<Placeholder> placeholder;
    };

    /**
     * @class RoutePattern
     * @brief 代表一个被“编译”过的路径或域名模板。
     *
     * 编译只在注册路由（或修改约束）时执行一次，之后每个请求直接使用编译好的正则。
     * 生成的正则总是锚定整个候选字符串（全匹配，而非前缀匹配）。
     *
     * @warning 约束字符串会被原样拼进正则。约束来自应用代码而不是客户端输入，
     *          这里不做任何转义或校验，写出灾难性回溯的正则是调用方的责任。
     */
    class RoutePattern {
    public:
        /// 路径参数在未指定约束时的默认正则
        static constexpr std::string_view kRequiredSegment = "[^/]+";
        static constexpr std::string_view kOptionalSegment = "[^/]*";
        /// 域名参数（以及 `*` 通配段）的默认正则
        static constexpr std::string_view kDomainSegment = "[a-zA-Z0-9_-]+";

        /**
         * @brief 编译路径模板，路径匹配大小写敏感。
         * @param tmpl 路径模板，例如 "/posts/{slug?}"。
         * @param constraints 参数名 -> 正则（或具名常用模式的名字，如 "id"、"uuid"）。
         * @throws InvalidRouteDefinition 生成的正则不合法
         */
        static RoutePattern compile(std::string_view tmpl, const ConstraintMap& constraints = {});

        /**
         * @brief 编译域名模板，域名匹配大小写不敏感。
         * @param tmpl 域名模板，例如 "{tenant}.example.com" 或 "*.example.com"。
         */
        static RoutePattern compile_domain(std::string_view tmpl, const ConstraintMap& constraints = {});

        /// 将模板切分为字面量与占位符
        static std::vector<TemplateToken> tokenize(std::string_view tmpl);

        /// 模板中的全部占位符（按出现顺序）
        static std::vector<Placeholder> placeholders(std::string_view tmpl);

        /**
         * @brief 具名常用模式库：id, uuid, slug, alpha, alphanumeric, email, any。
         * @return 不存在时返回 std::nullopt
         */
        static std::optional<std::string_view> named_pattern(std::string_view name);

        /**
         * @brief 尝试匹配一个候选字符串。
         * @return 匹配成功时返回参数表（未参与匹配的可选参数不会出现在表中），失败返回 std::nullopt。
         */
        std::optional<PathParams> match(std::string_view candidate) const;

        /// 参数名，按模板中出现的顺序
        const std::vector<std::string>& parameter_names() const { return parameter_names_; }

        /// 生成的正则源码，便于日志与调试
        const std::string& regex_source() const { return source_; }

    private:
        RoutePattern() = default;

        static RoutePattern build(std::string_view tmpl, const ConstraintMap& constraints, bool domain);

        std::regex regex_;
        std::string source_;
        std::vector<std::string> parameter_names_;
        // 参数名 -> 捕获组序号（约束内部自带的捕获组会让序号后移）
        std::vector<std::pair<std::string, size_t>> groups_;
    };

} // namespace meridian

#endif //MERIDIAN_ROUTE_PATTERN_HPP
