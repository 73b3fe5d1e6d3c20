#ifndef MERIDIAN_TYPE_COERCION_HPP
#define MERIDIAN_TYPE_COERCION_HPP

#include <string>
#include <string_view>
#include <vector>

#include <meridian/routing/handler.hpp>

namespace meridian::coercion {

    /**
     * @brief 把原始字符串转换为参数声明的类型。
     *
     * - integer / floating：取开头的数字部分（"42abc" -> 42，"abc" -> 0）；空串 -> 0，可空参数 -> null
     * - boolean：true/1/yes/on -> true，false/0/no/off/"" -> false，其他非空值 -> true
     * - string / mixed：原样
     * - array：包装为单元素列表
     * - enumeration：按值查找，找不到时回退为原始字符串
     */
    ArgumentValue coerce(const ParamDescriptor& param, std::string_view raw);

    /// 多值来源（查询参数、body 字段）：array 保留全部值，其他类型取第一个
    ArgumentValue coerce(const ParamDescriptor& param, const std::vector<std::string>& values);

} // namespace meridian::coercion

#endif //MERIDIAN_TYPE_COERCION_HPP
