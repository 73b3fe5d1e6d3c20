#ifndef MERIDIAN_PARAMETER_SET_HPP
#define MERIDIAN_PARAMETER_SET_HPP

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <meridian/error/exceptions.hpp>
#include <meridian/utils/param_parser.hpp>

namespace meridian {

    /**
     * @class ParameterSet
     * @brief 对一组字符串参数（路由参数、查询参数）做类型化只读访问。
     */
    template<typename MapType>
    class ParameterSet {
    public:
        explicit ParameterSet(const MapType& params) : params_(params) {}

        std::optional<std::string_view> get_sv(std::string_view key) const {
            auto it = params_.find(key);
            if (it != params_.end()) {
                return std::string_view(it->second);
            }
            return std::nullopt;
        }

        bool has(std::string_view key) const { return params_.find(key) != params_.end(); }

        /**
         * @throws BadRequestError 参数缺失或无法转换为 T
         */
        template<typename T>
        T get(std::string_view key) const {
            auto sv_opt = get_sv(key);
            if (!sv_opt) {
                throw BadRequestError("Missing required parameter: " + std::string(key));
            }

            if constexpr (std::is_same_v<T, std::string>) {
                return std::string(*sv_opt);
            } else if constexpr (std::is_same_v<T, std::string_view>) {
                return *sv_opt;
            } else {
                static_assert(std::is_arithmetic_v<T>, "Unsupported type for parameter conversion.");
                if (auto parsed = param_parser::tryParse<T>(*sv_opt)) {
                    return *parsed;
                }
                throw BadRequestError("Parameter '" + std::string(key) + "' with value '" + std::string(*sv_opt) + "' has an invalid format.");
            }
        }

        template<typename T>
        std::optional<T> get_optional(std::string_view key) const noexcept {
            try {
                return get<T>(key);
            } catch (const BadRequestError&) {
                return std::nullopt;
            }
        }

        template<typename T>
        T get_or_default(std::string_view key, T default_value) const {
            return get_optional<T>(key).value_or(std::move(default_value));
        }

    private:
        const MapType& params_;
    };

} // namespace meridian

#endif //MERIDIAN_PARAMETER_SET_HPP
