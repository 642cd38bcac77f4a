#include "lucent/handler.hpp"

namespace lucent
{

    ParamDescriptor ParamDescriptor::context(std::string name)
    {
        ParamDescriptor p;
        p.name = std::move(name);
        p.kind = ParamKind::Context;
        return p;
    }

    ParamDescriptor ParamDescriptor::entity(std::string name, std::string entity_type)
    {
        ParamDescriptor p;
        p.name = std::move(name);
        p.kind = ParamKind::Entity;
        p.type = std::move(entity_type);
        return p;
    }

    ParamDescriptor ParamDescriptor::service(std::string name, std::string service_key)
    {
        ParamDescriptor p;
        p.name = std::move(name);
        p.kind = ParamKind::Service;
        p.type = std::move(service_key);
        return p;
    }

    ParamDescriptor ParamDescriptor::scalar(std::string name,
                                            ScalarType type,
                                            std::optional<nlohmann::json> default_value)
    {
        ParamDescriptor p;
        p.name = std::move(name);
        p.kind = ParamKind::Scalar;
        p.scalar_type = type;
        p.type = scalar_type_to_string(type);
        p.default_value = std::move(default_value);
        return p;
    }

    void BoundArguments::set(const std::string &name, Value value)
    {
        if (!values_.contains(name))
            order_.push_back(name);
        values_.insert_or_assign(name, std::move(value));
    }

    bool BoundArguments::contains(const std::string &name) const
    {
        return values_.contains(name);
    }

    const BoundArguments::Value &BoundArguments::at(const std::string &name) const
    {
        auto it = values_.find(name);
        if (it == values_.end())
            throw LucentError::internal("Argument '" + name + "' is not bound");
        return it->second;
    }

    const nlohmann::json &BoundArguments::value(const std::string &name) const
    {
        auto *v = std::get_if<nlohmann::json>(&at(name));
        if (!v)
            throw LucentError::internal("Argument '" + name + "' is not a scalar");
        return *v;
    }

    std::int64_t BoundArguments::integer(const std::string &name) const
    {
        return coerce(value(name), ScalarType::Integer).get<std::int64_t>();
    }

    double BoundArguments::number(const std::string &name) const
    {
        return coerce(value(name), ScalarType::Float).get<double>();
    }

    bool BoundArguments::boolean(const std::string &name) const
    {
        return coerce(value(name), ScalarType::Boolean).get<bool>();
    }

    std::string BoundArguments::string(const std::string &name) const
    {
        return to_display_string(value(name));
    }

    const Entity &BoundArguments::entity(const std::string &name) const
    {
        auto *e = std::get_if<Entity>(&at(name));
        if (!e)
            throw LucentError::internal("Argument '" + name + "' is not an entity");
        return *e;
    }

    RequestContext &BoundArguments::context() const
    {
        for (const auto &[name, value] : values_)
        {
            if (auto *ctx = std::get_if<RequestContext *>(&value))
                return **ctx;
        }
        throw LucentError::internal("Handler did not declare a request context parameter");
    }

    const MethodDescriptor *ControllerDescriptor::method(const std::string &action) const
    {
        auto it = methods.find(action);
        return it == methods.end() ? nullptr : &it->second;
    }

    const ControllerDescriptor *HandlerRegistry::find(const std::string &name) const
    {
        auto it = controllers_.find(name);
        return it == controllers_.end() ? nullptr : &it->second;
    }

} // namespace lucent
