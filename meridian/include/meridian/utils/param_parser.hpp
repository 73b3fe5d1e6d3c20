#ifndef MERIDIAN_PARAM_PARSER_HPP
#define MERIDIAN_PARAM_PARSER_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace meridian::param_parser {

    // 不区分大小写的 string_view 比较
    inline bool isEquals(std::string_view a, std::string_view b) {
        return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](const char x, const char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    }

    /**
     * @brief 宽松的布尔解析。
     *
     * "true" / "1" / "yes" / "on"  -> true
     * "false" / "0" / "no" / "off" / "" -> false
     * 其他值返回 std::nullopt
     */
    inline std::optional<bool> parseBool(std::string_view sv) {
        if (sv.empty()) return false;
        for (const auto t : {"true", "1", "yes", "on"}) {
            if (isEquals(sv, t)) return true;
        }
        for (const auto f : {"false", "0", "no", "off"}) {
            if (isEquals(sv, f)) return false;
        }
        return std::nullopt;
    }

    /**
     * @brief 严格解析：整个字符串都必须是合法的 T。
     */
    template<typename T>
    std::optional<T> tryParse(std::string_view sv) {
        if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>) {
            T value;
            auto result = std::from_chars(sv.data(), sv.data() + sv.size(), value);
            if (result.ec == std::errc() && result.ptr == sv.data() + sv.size()) {
                return value;
            }
        } else if constexpr (std::is_same_v<T, bool>) {
            return parseBool(sv);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return std::string{sv};
        } else if constexpr (std::is_same_v<T, std::string_view>) {
            return sv;
        }
        return std::nullopt;
    }

    /**
     * @brief 前缀解析：跳过前导空白，读取开头尽可能长的数字，后面的内容忽略。
     *        "42abc" -> 42，"abc" -> 0，"" -> 0。
     */
    template<typename T>
        requires std::is_arithmetic_v<T>
    T parseLeading(std::string_view sv) {
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
            sv.remove_prefix(1);
        }
        // from_chars 不接受前导 '+'
        if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);

        T value{};
        const auto result = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (result.ec == std::errc::result_out_of_range) {
            const bool negative = sv.front() == '-';
            if constexpr (std::is_floating_point_v<T>) {
                // 溢出取最大值，下溢取 0
                const long double wide = std::strtold(std::string(sv).c_str(), nullptr);
                if (wide == 0.0L) return T{};
                return negative ? std::numeric_limits<T>::lowest() : std::numeric_limits<T>::max();
            } else {
                return negative ? std::numeric_limits<T>::min() : std::numeric_limits<T>::max();
            }
        }
        if (result.ec != std::errc()) {
            return T{};
        }
        return value;
    }

} // namespace meridian::param_parser

#endif //MERIDIAN_PARAM_PARSER_HPP
