#include "lucent/binder.hpp"
#include <spdlog/spdlog.h>

namespace lucent
{

    namespace
    {
        using Value = BoundArguments::Value;

        bool is_positional(const ParamDescriptor &p)
        {
            return p.kind != ParamKind::Context && p.kind != ParamKind::Service && p.name != "options";
        }

        std::string missing_message(const ParamDescriptor &param,
                                    const std::vector<ParamDescriptor> &params,
                                    const RequestContext &context,
                                    BindMode mode)
        {
            if (mode == BindMode::Command)
            {
                return "Argument missing: The '" + param.name + "' argument is required for this command.\n"
                       "Expected format: [command] [argument_name]\n"
                       "Example usage: " + context.route.pattern + usage_suffix(params);
            }
            return "Argument missing: The '" + param.name + "' parameter of " + context.route.controller +
                   "::" + context.route.action + " has no value in route '" + context.route.pattern + "'";
        }
    } // namespace

    ParameterBinder::ParameterBinder(const ServiceRegistry &services,
                                     const EntityRegistry &entities,
                                     std::shared_ptr<EntityStore> store)
        : services_(services), entities_(entities), store_(std::move(store))
    {
    }

    Result<bool> ParameterBinder::bind_entity(const ParamDescriptor &param,
                                              RequestContext &context,
                                              BoundArguments &out) const
    {
        auto pk = entities_.primary_key(param.type);
        if (!pk)
        {
            return std::unexpected(LucentError::handler_resolution(
                "Parameter '" + param.name + "' declares unregistered entity type " + param.type));
        }

        auto captured = context.variables.find(param.name);
        if (captured == context.variables.end())
            return false;
        const auto &key_value = captured->second;

        // Binding stashes under the parameter name, rule checks under the type name.
        for (const auto &name : {param.name, param.type})
        {
            if (const auto *cached = context.entities.find(name, param.type);
                cached && cached->field(*pk) == key_value)
            {
                spdlog::debug("reusing {} {} from request context", param.type, key_value);
                out.set(param.name, Value(std::in_place_type<Entity>, *cached));
                return true;
            }
        }

        if (!store_)
        {
            return std::unexpected(LucentError::internal(
                "No entity store configured to bind parameter '" + param.name + "'"));
        }

        auto found = store_->find_one(param.type, *pk, key_value);
        if (!found)
            return std::unexpected(found.error());
        if (!found->has_value())
        {
            return std::unexpected(LucentError::entity_not_found(
                "No " + param.type + " with " + *pk + " = " + key_value));
        }

        context.entities.put(param.name, **found);
        out.set(param.name, Value(std::in_place_type<Entity>, std::move(**found)));
        return true;
    }

    Result<BoundArguments> ParameterBinder::bind(const std::vector<ParamDescriptor> &params,
                                                 RequestContext &context,
                                                 BindMode mode) const
    {
        BoundArguments out;
        bool context_bound = false;

        for (const auto &param : params)
        {
            if (param.kind == ParamKind::Context)
            {
                if (context_bound)
                {
                    return std::unexpected(LucentError::handler_resolution(
                        "Handler declares more than one request context parameter ('" + param.name + "')"));
                }
                out.set(param.name, Value(std::in_place_type<RequestContext *>, &context));
                context_bound = true;
                continue;
            }

            if (param.kind == ParamKind::Entity && mode == BindMode::Http)
            {
                auto bound = bind_entity(param, context, out);
                if (!bound)
                    return std::unexpected(bound.error());
                if (*bound)
                    continue;
            }

            if (param.kind == ParamKind::Service)
            {
                if (auto handle = services_.handle(param.type))
                {
                    out.set(param.name, Value(std::in_place_type<ServiceHandle>, *handle));
                    continue;
                }
            }

            auto target = param.kind == ParamKind::Scalar ? param.scalar_type : ScalarType::Any;

            if (mode == BindMode::Command && param.name == "options")
            {
                auto options = target == ScalarType::Any ? context.options : coerce(context.options, target);
                out.set(param.name, Value(std::in_place_type<nlohmann::json>, std::move(options)));
                continue;
            }

            if (auto it = context.variables.find(param.name); it != context.variables.end())
            {
                out.set(param.name, Value(std::in_place_type<nlohmann::json>, coerce(nlohmann::json(it->second), target)));
                continue;
            }

            if (param.default_value)
            {
                out.set(param.name, Value(std::in_place_type<nlohmann::json>, *param.default_value));
                continue;
            }

            return std::unexpected(LucentError::missing_argument(missing_message(param, params, context, mode)));
        }

        return out;
    }

    Result<BoundArguments> ParameterBinder::bind_constructor(const std::string &controller,
                                                             const std::vector<ParamDescriptor> &params) const
    {
        BoundArguments out;
        for (const auto &param : params)
        {
            if (param.kind == ParamKind::Service)
            {
                if (auto handle = services_.handle(param.type))
                {
                    out.set(param.name, Value(std::in_place_type<ServiceHandle>, *handle));
                    continue;
                }
            }
            if (param.default_value)
            {
                out.set(param.name, Value(std::in_place_type<nlohmann::json>, *param.default_value));
                continue;
            }
            return std::unexpected(LucentError::handler_resolution(
                "Constructor of " + controller + " requires service '" + param.type + "' for parameter '" +
                param.name + "', which is not registered"));
        }
        return out;
    }

    std::string usage_suffix(const std::vector<ParamDescriptor> &params)
    {
        std::string out;
        for (const auto &p : params)
        {
            if (is_positional(p))
                out += " [" + p.name + "]";
        }
        return out;
    }

} // namespace lucent
