#include "lucent/middleware.hpp"
#include <spdlog/spdlog.h>

namespace lucent
{

    FunctionMiddleware::FunctionMiddleware(std::string name, Fn fn)
        : name_(std::move(name)), fn_(std::move(fn))
    {
    }

    RequestContext FunctionMiddleware::handle(RequestContext context)
    {
        return fn_(std::move(context));
    }

    MiddlewarePipeline::MiddlewarePipeline(std::vector<MiddlewarePtr> stages)
        : stages_(std::move(stages))
    {
    }

    MiddlewarePipeline MiddlewarePipeline::concat(const std::vector<MiddlewarePtr> &global,
                                                  const std::vector<MiddlewarePtr> &route)
    {
        std::vector<MiddlewarePtr> stages;
        stages.reserve(global.size() + route.size());
        stages.insert(stages.end(), global.begin(), global.end());
        stages.insert(stages.end(), route.begin(), route.end());
        return MiddlewarePipeline(std::move(stages));
    }

    MiddlewarePipeline &MiddlewarePipeline::add(MiddlewarePtr stage)
    {
        stages_.push_back(std::move(stage));
        return *this;
    }

    RequestContext MiddlewarePipeline::run(RequestContext context) const
    {
        for (const auto &stage : stages_)
        {
            if (!stage)
                continue;
            spdlog::debug("running middleware {}", stage->name());
            context = stage->handle(std::move(context));
        }
        return context;
    }

} // namespace lucent
