#include <meridian/utils/string_match.hpp>

#include <algorithm>
#include <numeric>
#include <vector>

namespace meridian::utils {

    bool wildcard_match(const std::string_view pattern, const std::string_view value) {
        size_t p = 0, v = 0;
        size_t star = std::string_view::npos, mark = 0;

        while (v < value.size()) {
            if (p < pattern.size() && pattern[p] == '*') {
                star = p++;
                mark = v;
            } else if (p < pattern.size() && pattern[p] == value[v]) {
                ++p;
                ++v;
            } else if (star != std::string_view::npos) {
                // 回溯：让上一个 '*' 多吞一个字符
                p = star + 1;
                v = ++mark;
            } else {
                return false;
            }
        }
        while (p < pattern.size() && pattern[p] == '*') ++p;
        return p == pattern.size();
    }

    std::size_t levenshtein(const std::string_view a, const std::string_view b) {
        std::vector<std::size_t> row(b.size() + 1);
        std::iota(row.begin(), row.end(), 0);

        for (size_t i = 1; i <= a.size(); ++i) {
            size_t diagonal = row[0];
            row[0] = i;
            for (size_t j = 1; j <= b.size(); ++j) {
                const size_t above = row[j];
                const size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
                row[j] = std::min({row[j] + 1, row[j - 1] + 1, diagonal + cost});
                diagonal = above;
            }
        }
        return row[b.size()];
    }

} // namespace meridian::utils
