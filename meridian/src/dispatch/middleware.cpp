#include <meridian/dispatch/middleware.hpp>

namespace meridian {

    namespace {
        class FunctionMiddleware final : public Middleware {
        public:
            explicit FunctionMiddleware(MiddlewareFunc fn) : fn_(std::move(fn)) {}

            HttpResponse handle(RequestContext& ctx, const Next& next) override {
                return fn_(ctx, next);
            }

        private:
            MiddlewareFunc fn_;
        };
    } // namespace

    std::shared_ptr<Middleware> make_middleware(MiddlewareFunc fn) {
        return std::make_shared<FunctionMiddleware>(std::move(fn));
    }

    std::string describe_middleware(const MiddlewareRef& ref) {
        if (const auto* name = std::get_if<std::string>(&ref)) return *name;
        return "Closure";
    }

    HttpResponse MiddlewarePipeline::run(RequestContext& ctx, const Next& terminal) const {
        return call(0, ctx, terminal);
    }

    HttpResponse MiddlewarePipeline::call(const size_t index, RequestContext& ctx, const Next& terminal) const {
        if (index >= stack_.size()) {
            return terminal(ctx);
        }
        const Next next = [this, index, &terminal](RequestContext& c) {
            return call(index + 1, c, terminal);
        };
        return stack_[index]->handle(ctx, next);
    }

} // namespace meridian
