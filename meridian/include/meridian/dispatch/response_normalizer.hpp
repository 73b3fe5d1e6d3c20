#ifndef MERIDIAN_RESPONSE_NORMALIZER_HPP
#define MERIDIAN_RESPONSE_NORMALIZER_HPP

#include <meridian/http/http_common_types.hpp>
#include <meridian/routing/handler.hpp>

namespace meridian {

    /**
     * @brief 把 handler 的返回值统一转换为 HttpResponse，规则见 HandlerResult。
     * @throws InvalidHandlerReturn 返回了无法识别的类型（消息中包含实际类型名）
     */
    HttpResponse normalize_response(HandlerResult result);

} // namespace meridian

#endif //MERIDIAN_RESPONSE_NORMALIZER_HPP
