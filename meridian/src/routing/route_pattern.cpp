#include <meridian/routing/route_pattern.hpp>
#include <meridian/error/exceptions.hpp>

#include <array>
#include <spdlog/spdlog.h>

namespace meridian {

    namespace {

        constexpr std::array<std::pair<std::string_view, std::string_view>, 7> kNamedPatterns = {{
            {"id", "[0-9]+"},
            {"uuid", "[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}"},
            {"slug", "[a-z0-9]+(?:-[a-z0-9]+)*"},
            {"alpha", "[a-zA-Z]+"},
            {"alphanumeric", "[a-zA-Z0-9]+"},
            {"email", "[^/@]+@[^/@]+\\.[^/@]+"},
            {"any", ".*"},
        }};

        bool is_identifier_char(const char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
        }

        bool is_identifier(std::string_view sv) {
            if (sv.empty()) return false;
            for (const char c : sv) {
                if (!is_identifier_char(c)) return false;
            }
            return true;
        }

        // 解析 `{...}` 内部的文本，不符合语法时返回 nullopt（按字面量处理）
        std::optional<Placeholder> parse_placeholder(std::string_view body) {
            Placeholder ph;
            if (!body.empty() && body.back() == '?') {
                ph.optional = true;
                body.remove_suffix(1);
            }
            if (const auto colon = body.find(':'); colon != std::string_view::npos) {
                const std::string_view key = body.substr(colon + 1);
                if (!is_identifier(key)) return std::nullopt;
                ph.binding_key = std::string(key);
                body = body.substr(0, colon);
            }
            if (!is_identifier(body)) return std::nullopt;
            ph.name = std::string(body);
            return ph;
        }

        void append_escaped(std::string& out, const char c) {
            switch (c) {
                case '.': case '^': case '$': case '|': case '(': case ')':
                case '[': case ']': case '{': case '}': case '*': case '+':
                case '?': case '\\':
                    out += '\\';
                    [[fallthrough]];
                default:
                    out += c;
            }
        }

        // 统计约束正则中自带的捕获组数量，用于修正参数对应的组序号
        size_t count_capture_groups(std::string_view pattern) {
            size_t n = 0;
            bool in_class = false;
            for (size_t i = 0; i < pattern.size(); ++i) {
                const char c = pattern[i];
                if (c == '\\') {
                    ++i;
                    continue;
                }
                if (in_class) {
                    if (c == ']') in_class = false;
                    continue;
                }
                if (c == '[') {
                    in_class = true;
                } else if (c == '(' && (i + 1 >= pattern.size() || pattern[i + 1] != '?')) {
                    ++n;
                }
            }
            return n;
        }

        std::string resolve_constraint(const Placeholder& ph, const ConstraintMap& constraints, const bool domain) {
            if (const auto it = constraints.find(ph.name); it != constraints.end()) {
                if (const auto named = RoutePattern::named_pattern(it->second)) {
                    return std::string(*named);
                }
                return it->second;
            }
            if (domain) return std::string(RoutePattern::kDomainSegment);
            return std::string(ph.optional ? RoutePattern::kOptionalSegment : RoutePattern::kRequiredSegment);
        }

    } // namespace


    std::vector<TemplateToken> RoutePattern::tokenize(const std::string_view tmpl) {
        std::vector<TemplateToken> tokens;
        std::string literal;

        size_t i = 0;
        while (i < tmpl.size()) {
            if (tmpl[i] == '{') {
                if (const auto close = tmpl.find('}', i); close != std::string_view::npos) {
                    if (auto ph = parse_placeholder(tmpl.substr(i + 1, close - i - 1))) {
                        if (!literal.empty()) {
                            tokens.push_back({std::move(literal), std::nullopt});
                            literal.clear();
                        }
                        tokens.push_back({{}, std::move(ph)});
                        i = close + 1;
                        continue;
                    }
                }
            }
            literal += tmpl[i++];
        }
        if (!literal.empty()) {
            tokens.push_back({std::move(literal), std::nullopt});
        }
        return tokens;
    }

    std::vector<Placeholder> RoutePattern::placeholders(const std::string_view tmpl) {
        std::vector<Placeholder> out;
        for (auto& token : tokenize(tmpl)) {
            if (token.placeholder) out.push_back(std::move(*token.placeholder));
        }
        return out;
    }

    std::optional<std::string_view> RoutePattern::named_pattern(const std::string_view name) {
        for (const auto& [key, pattern] : kNamedPatterns) {
            if (key == name) return pattern;
        }
        return std::nullopt;
    }

    RoutePattern RoutePattern::compile(const std::string_view tmpl, const ConstraintMap& constraints) {
        return build(tmpl, constraints, false);
    }

    RoutePattern RoutePattern::compile_domain(const std::string_view tmpl, const ConstraintMap& constraints) {
        return build(tmpl, constraints, true);
    }

    RoutePattern RoutePattern::build(const std::string_view tmpl, const ConstraintMap& constraints, const bool domain) {
        RoutePattern out;
        const auto tokens = tokenize(tmpl);

        std::string source = "^";
        size_t group = 0;

        for (size_t t = 0; t < tokens.size(); ++t) {
            const auto& token = tokens[t];

            if (!token.placeholder) {
                std::string_view literal = token.literal;
                // 可选参数前面的 '/' 与可选组一起吞掉，缺省时不会留下悬空的分隔符
                const bool next_is_optional = !domain && t + 1 < tokens.size()
                                              && tokens[t + 1].placeholder && tokens[t + 1].placeholder->optional;
                if (next_is_optional && !literal.empty() && literal.back() == '/') {
                    literal.remove_suffix(1);
                }
                for (const char c : literal) {
                    if (domain && c == '*') {
                        source += kDomainSegment;
                    } else {
                        append_escaped(source, c);
                    }
                }
                continue;
            }

            const Placeholder& ph = *token.placeholder;
            const std::string constraint = resolve_constraint(ph, constraints, domain);
            const bool slash_before = !domain && ph.optional && t > 0 && !tokens[t - 1].placeholder
                                      && !tokens[t - 1].literal.empty() && tokens[t - 1].literal.back() == '/';

            ++group;
            out.groups_.emplace_back(ph.name, group);
            out.parameter_names_.push_back(ph.name);
            group += count_capture_groups(constraint);

            if (slash_before) {
                source += "(?:/(" + constraint + "))?";
            } else if (ph.optional) {
                source += "(" + constraint + ")?";
            } else {
                source += "(" + constraint + ")";
            }
        }
        source += "$";

        try {
            auto flags = std::regex::ECMAScript;
            if (domain) flags |= std::regex::icase;
            out.regex_ = std::regex(source, flags);
        } catch (const std::regex_error& e) {
            SPDLOG_ERROR("Invalid route pattern '{}' compiled to '{}': {}", tmpl, source, e.what());
            throw InvalidRouteDefinition("Invalid route pattern [" + std::string(tmpl) + "]: " + e.what());
        }
        out.source_ = std::move(source);
        return out;
    }

    std::optional<PathParams> RoutePattern::match(const std::string_view candidate) const {
        const std::string subject(candidate);
        std::smatch m;
        if (!std::regex_match(subject, m, regex_)) {
            return std::nullopt;
        }

        PathParams params;
        for (const auto& [name, index] : groups_) {
            if (index < m.size() && m[index].matched) {
                params[name] = m[index].str();
            }
        }
        return params;
    }

} // namespace meridian
