#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace lucent
{

    /**
     * A persistent entity: a typed JSON document identified by the value of its
     * primary-key column.
     */
    struct Entity
    {
        std::string type;
        std::string primary_key{"id"};
        nlohmann::json attributes = nlohmann::json::object();

        /** String form of the primary-key value ("" when absent). */
        std::string key() const;

        /** String form of a column value, if the column is present. */
        std::optional<std::string> field(const std::string &column) const;

        nlohmann::json to_json() const;
        static Result<Entity> from_json(const nlohmann::json &j);
    };

    /**
     * Declares which types are persistent entities and which column holds each
     * type's primary key.
     */
    class EntityRegistry
    {
    public:
        void add(std::string type, std::string primary_key = "id");

        bool contains(const std::string &type) const;

        /** Primary-key column of a registered type. */
        std::optional<std::string> primary_key(const std::string &type) const;

        void clear() { primary_keys_.clear(); }

    private:
        std::unordered_map<std::string, std::string> primary_keys_;
    };

} // namespace lucent
