#include "lucent/entity_store.hpp"
#include <nlohmann/json.hpp>
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace lucent
{

    namespace
    {
        std::string record_key(const std::string &type, const std::string &key)
        {
            return type + ":" + key;
        }

        Result<Entity> decode(const std::string &db_key, const std::string &raw)
        {
            auto parsed = nlohmann::json::parse(raw, nullptr, false);
            if (parsed.is_discarded())
                return std::unexpected(LucentError::storage("Corrupt entity record at " + db_key));
            return Entity::from_json(parsed);
        }
    } // namespace

    class RocksDbEntityStore::Impl
    {
    public:
        explicit Impl(const StorageConfig &cfg)
        {
            rocksdb::Options options;
            options.create_if_missing = cfg.create_if_missing;
            auto status = rocksdb::DB::Open(options, cfg.rocksdb_path, &db);
            if (!status.ok())
            {
                throw std::runtime_error("RocksDB open failed: " + status.ToString());
            }
            spdlog::info("entity store opened at {}", cfg.rocksdb_path);
        }

        ~Impl()
        {
            delete db;
        }

        Result<std::optional<Entity>> find(const std::string &type,
                                           const std::string &column,
                                           const std::string &value)
        {
            // Fast path: the value is a primary key of this type.
            std::string raw;
            auto direct_key = record_key(type, value);
            auto status = db->Get(rocksdb::ReadOptions(), direct_key, &raw);
            if (status.ok())
            {
                auto entity = decode(direct_key, raw);
                if (!entity)
                    return std::unexpected(entity.error());
                if (entity->primary_key == column)
                    return std::optional<Entity>(std::move(*entity));
            }
            else if (!status.IsNotFound())
            {
                return std::unexpected(LucentError::storage("RocksDB Get failed: " + status.ToString()));
            }

            auto prefix = type + ":";
            std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
            for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next())
            {
                auto db_key = it->key().ToString();
                auto entity = decode(db_key, it->value().ToString());
                if (!entity)
                    return std::unexpected(entity.error());
                if (entity->field(column) == value)
                    return std::optional<Entity>(std::move(*entity));
            }
            if (!it->status().ok())
            {
                return std::unexpected(LucentError::storage("RocksDB scan failed: " + it->status().ToString()));
            }
            return std::optional<Entity>{};
        }

        Result<void> put(const Entity &entity)
        {
            auto key = entity.key();
            if (key.empty())
            {
                return std::unexpected(LucentError::invalid_input(
                    "Entity of type " + entity.type + " has no value for primary key '" + entity.primary_key + "'"));
            }
            auto status = db->Put(rocksdb::WriteOptions(), record_key(entity.type, key), entity.to_json().dump());
            if (!status.ok())
            {
                return std::unexpected(LucentError::storage("RocksDB Put failed: " + status.ToString()));
            }
            return {};
        }

    private:
        rocksdb::DB *db{nullptr};
    };

    RocksDbEntityStore::RocksDbEntityStore(const StorageConfig &cfg) : impl_(std::make_unique<Impl>(cfg)) {}
    RocksDbEntityStore::~RocksDbEntityStore() = default;

    Result<std::optional<Entity>> RocksDbEntityStore::find_one(const std::string &type,
                                                               const std::string &column,
                                                               const std::string &value)
    {
        return impl_->find(type, column, value);
    }

    Result<void> RocksDbEntityStore::save(const Entity &entity)
    {
        return impl_->put(entity);
    }

} // namespace lucent
