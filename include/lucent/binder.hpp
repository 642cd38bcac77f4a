#pragma once

#include "types.hpp"
#include "entity.hpp"
#include "entity_store.hpp"
#include "handler.hpp"
#include "request_context.hpp"
#include "service_registry.hpp"
#include <memory>
#include <vector>

namespace lucent
{

    enum class BindMode
    {
        Http,   // full resolution including route-model binding
        Command // no model binding; "options" receives the --option bag
    };

    /**
     * Resolves declared handler parameters against the request context, the
     * service registry and the entity store. Resolution order per parameter:
     * context injection, route-model binding, service injection, captured
     * variable with coercion, declared default, otherwise MissingArgument.
     */
    class ParameterBinder
    {
    public:
        ParameterBinder(const ServiceRegistry &services,
                        const EntityRegistry &entities,
                        std::shared_ptr<EntityStore> store);

        /**
         * Bind handler method parameters. Entities fetched here are stashed in
         * context.entities under the parameter name.
         * @return EntityNotFound when a bound key has no entity, MissingArgument
         *         when a parameter has no source and no default
         */
        Result<BoundArguments> bind(const std::vector<ParamDescriptor> &params,
                                    RequestContext &context,
                                    BindMode mode) const;

        /** Bind constructor parameters; only services and defaults are eligible. */
        Result<BoundArguments> bind_constructor(const std::string &controller,
                                                const std::vector<ParamDescriptor> &params) const;

    private:
        Result<bool> bind_entity(const ParamDescriptor &param,
                                 RequestContext &context,
                                 BoundArguments &out) const;

        const ServiceRegistry &services_;
        const EntityRegistry &entities_;
        std::shared_ptr<EntityStore> store_;
    };

    /** " [a] [b]" usage suffix listing the positional parameters of a command. */
    std::string usage_suffix(const std::vector<ParamDescriptor> &params);

} // namespace lucent
