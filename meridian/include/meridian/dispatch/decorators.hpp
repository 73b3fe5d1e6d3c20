#ifndef MERIDIAN_DECORATORS_HPP
#define MERIDIAN_DECORATORS_HPP

#include <string>

#include <meridian/routing/handler.hpp>

namespace meridian::decorators {

    /// 在 handler 的响应上设置一个头（覆盖已有值）
    Decorator with_header(std::string name, std::string value);

    /// Cache-Control: public, max-age=<seconds>
    Decorator cache_control(unsigned seconds);

    /// 把装饰器按顺序套在 action 上，最后一个位于最外层
    Action apply(Action action, const std::vector<Decorator>& decorators);

} // namespace meridian::decorators

#endif //MERIDIAN_DECORATORS_HPP
