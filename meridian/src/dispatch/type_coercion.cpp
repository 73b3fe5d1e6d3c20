#include <meridian/dispatch/type_coercion.hpp>
#include <meridian/utils/param_parser.hpp>

namespace meridian::coercion {

    ArgumentValue coerce(const ParamDescriptor& param, const std::string_view raw) {
        switch (param.type) {
            case ParamType::integer:
                if (raw.empty() && param.nullable) return std::monostate{};
                return param_parser::parseLeading<std::int64_t>(raw);

            case ParamType::floating:
                if (raw.empty() && param.nullable) return std::monostate{};
                return param_parser::parseLeading<double>(raw);

            case ParamType::boolean:
                // 无法识别的非空字符串按真值处理
                return param_parser::parseBool(raw).value_or(true);

            case ParamType::array:
                return std::vector<std::string>{std::string(raw)};

            case ParamType::enumeration:
                if (param.enum_lookup) {
                    if (auto found = param.enum_lookup(raw)) {
                        return ObjectArg{std::move(*found)};
                    }
                }
                return std::string(raw);

            default:
                return std::string(raw);
        }
    }

    ArgumentValue coerce(const ParamDescriptor& param, const std::vector<std::string>& values) {
        if (param.type == ParamType::array) {
            return values;
        }
        return coerce(param, values.empty() ? std::string_view{} : std::string_view(values.front()));
    }

} // namespace meridian::coercion
