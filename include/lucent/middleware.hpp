#pragma once

#include "request_context.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace lucent
{

    /**
     * A request transformer run before the handler. It may return the context
     * unchanged or mutated; fatal problems are thrown and reach the caller of
     * the dispatcher untouched.
     */
    class Middleware
    {
    public:
        virtual ~Middleware() = default;

        virtual RequestContext handle(RequestContext context) = 0;

        /** Name used in log lines. */
        virtual std::string name() const { return "middleware"; }
    };

    /** Adapts a callable to the Middleware interface. */
    class FunctionMiddleware : public Middleware
    {
    public:
        using Fn = std::function<RequestContext(RequestContext)>;

        FunctionMiddleware(std::string name, Fn fn);

        RequestContext handle(RequestContext context) override;
        std::string name() const override { return name_; }

    private:
        std::string name_;
        Fn fn_;
    };

    using MiddlewarePtr = std::shared_ptr<Middleware>;

    /**
     * Ordered chain of middleware. Each stage receives the previous stage's
     * output; the chain always runs to completion.
     */
    class MiddlewarePipeline
    {
    public:
        MiddlewarePipeline() = default;
        explicit MiddlewarePipeline(std::vector<MiddlewarePtr> stages);

        /** Build the chain for one request: global stages first, then the route's own. */
        static MiddlewarePipeline concat(const std::vector<MiddlewarePtr> &global,
                                         const std::vector<MiddlewarePtr> &route);

        MiddlewarePipeline &add(MiddlewarePtr stage);

        RequestContext run(RequestContext context) const;

        std::size_t size() const { return stages_.size(); }

    private:
        std::vector<MiddlewarePtr> stages_;
    };

} // namespace lucent
