#pragma once

#include "types.hpp"
#include "entity.hpp"
#include "config.hpp"
#include <memory>
#include <optional>
#include <string>

namespace lucent
{

    /**
     * Abstract persistence collaborator used by route-model binding and the
     * "unique" validation operation. Every call is a single synchronous attempt.
     */
    class EntityStore
    {
    public:
        virtual ~EntityStore() = default;

        /**
         * Find the first entity of a type whose column equals value.
         * @param type Entity type name (e.g. "User")
         * @param column Column to compare
         * @param value Expected column value, compared in string form
         * @return The entity, std::nullopt when none matches, or a StorageError
         */
        virtual Result<std::optional<Entity>> find_one(
            const std::string &type,
            const std::string &column,
            const std::string &value) = 0;

        /**
         * Insert or replace an entity, keyed by type and primary-key value.
         */
        virtual Result<void> save(const Entity &entity) = 0;
    };

    /**
     * RocksDB-backed EntityStore. Entities are stored as JSON under
     * "<type>:<primary key>"; lookups by other columns scan the type's prefix.
     */
    class RocksDbEntityStore : public EntityStore
    {
    public:
        explicit RocksDbEntityStore(const StorageConfig &cfg);
        ~RocksDbEntityStore() override;

        Result<std::optional<Entity>> find_one(
            const std::string &type,
            const std::string &column,
            const std::string &value) override;

        Result<void> save(const Entity &entity) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace lucent
