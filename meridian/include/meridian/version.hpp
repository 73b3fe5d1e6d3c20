#ifndef MERIDIAN_VERSION_HPP
#define MERIDIAN_VERSION_HPP

#include <string_view>

namespace meridian::framework {
    constexpr std::string_view name = "Meridian";
    // 与 CMakeLists.txt 中的 project VERSION 保持一致
    constexpr std::string_view version = "1.0.0";
}
#endif //MERIDIAN_VERSION_HPP
