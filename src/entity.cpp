#include "lucent/entity.hpp"
#include "lucent/coercion.hpp"

namespace lucent
{

    std::string Entity::key() const
    {
        return field(primary_key).value_or(std::string{});
    }

    std::optional<std::string> Entity::field(const std::string &column) const
    {
        if (!attributes.is_object())
            return std::nullopt;
        auto it = attributes.find(column);
        if (it == attributes.end())
            return std::nullopt;
        return to_display_string(*it);
    }

    nlohmann::json Entity::to_json() const
    {
        return nlohmann::json{{"type", type},
                              {"primary_key", primary_key},
                              {"attributes", attributes}};
    }

    Result<Entity> Entity::from_json(const nlohmann::json &j)
    {
        if (!j.is_object() || !j.contains("type") || !j["type"].is_string())
            return std::unexpected(LucentError::parsing("Entity JSON requires a string 'type'"));

        Entity entity;
        entity.type = j["type"].get<std::string>();
        if (auto pk = j.find("primary_key"); pk != j.end() && pk->is_string())
            entity.primary_key = pk->get<std::string>();
        if (auto attrs = j.find("attributes"); attrs != j.end())
        {
            if (!attrs->is_object())
                return std::unexpected(LucentError::parsing("Entity attributes must be an object"));
            entity.attributes = *attrs;
        }
        return entity;
    }

    void EntityRegistry::add(std::string type, std::string primary_key)
    {
        primary_keys_[std::move(type)] = std::move(primary_key);
    }

    bool EntityRegistry::contains(const std::string &type) const
    {
        return primary_keys_.contains(type);
    }

    std::optional<std::string> EntityRegistry::primary_key(const std::string &type) const
    {
        auto it = primary_keys_.find(type);
        if (it == primary_keys_.end())
            return std::nullopt;
        return it->second;
    }

} // namespace lucent
