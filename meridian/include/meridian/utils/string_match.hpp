#ifndef MERIDIAN_STRING_MATCH_HPP
#define MERIDIAN_STRING_MATCH_HPP

#include <cstddef>
#include <string_view>

namespace meridian::utils {

    /// `*` 匹配任意长度（含空）字符的通配比较，例如 "admin.*" 匹配 "admin.users.index"
    bool wildcard_match(std::string_view pattern, std::string_view value);

    /// 两个字符串的编辑距离
    std::size_t levenshtein(std::string_view a, std::string_view b);

} // namespace meridian::utils

#endif //MERIDIAN_STRING_MATCH_HPP
