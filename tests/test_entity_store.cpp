#include <catch2/catch_test_macros.hpp>
#include "lucent/entity_store.hpp"
#include <filesystem>

using namespace lucent;

namespace
{
    struct TempStore
    {
        TempStore()
        {
            path = std::filesystem::temp_directory_path() / "lucent_entity_store_test";
            std::filesystem::remove_all(path);
            StorageConfig cfg;
            cfg.rocksdb_path = path.string();
            store = std::make_unique<RocksDbEntityStore>(cfg);
        }

        ~TempStore()
        {
            store.reset();
            std::filesystem::remove_all(path);
        }

        Entity make(const std::string &type, nlohmann::json attributes, const std::string &pk = "id")
        {
            Entity e;
            e.type = type;
            e.primary_key = pk;
            e.attributes = std::move(attributes);
            return e;
        }

        std::filesystem::path path;
        std::unique_ptr<RocksDbEntityStore> store;
    };
}

TEST_CASE("RocksDB store finds entities by primary key", "[entity_store]")
{
    TempStore t;
    REQUIRE(t.store->save(t.make("User", {{"id", 7}, {"email", "ada@example.com"}})).has_value());

    auto found = t.store->find_one("User", "id", "7");
    REQUIRE(found.has_value());
    REQUIRE(found->has_value());
    REQUIRE((*found)->field("email") == "ada@example.com");

    auto missing = t.store->find_one("User", "id", "8");
    REQUIRE(missing.has_value());
    REQUIRE_FALSE(missing->has_value());
}

TEST_CASE("RocksDB store scans the type prefix for other columns", "[entity_store]")
{
    TempStore t;
    REQUIRE(t.store->save(t.make("User", {{"id", 1}, {"email", "ada@example.com"}})).has_value());
    REQUIRE(t.store->save(t.make("User", {{"id", 2}, {"email", "grace@example.com"}})).has_value());
    REQUIRE(t.store->save(t.make("Team", {{"id", 3}, {"email", "grace@example.com"}})).has_value());

    auto found = t.store->find_one("User", "email", "grace@example.com");
    REQUIRE(found.has_value());
    REQUIRE(found->has_value());
    REQUIRE((*found)->type == "User");
    REQUIRE((*found)->key() == "2");

    SECTION("a key that equals a column value does not shortcut the scan")
    {
        REQUIRE(t.store->save(t.make("Tag", {{"id", "red"}, {"label", "blue"}})).has_value());
        REQUIRE(t.store->save(t.make("Tag", {{"id", "blue"}, {"label", "red"}})).has_value());
        auto tag = t.store->find_one("Tag", "label", "red");
        REQUIRE(tag.has_value());
        REQUIRE(tag->has_value());
        REQUIRE((*tag)->key() == "blue");
    }

    SECTION("no match is an empty result")
    {
        auto none = t.store->find_one("User", "email", "nobody@example.com");
        REQUIRE(none.has_value());
        REQUIRE_FALSE(none->has_value());
    }
}

TEST_CASE("RocksDB store rejects entities without a primary key", "[entity_store]")
{
    TempStore t;
    auto saved = t.store->save(t.make("User", {{"email", "ada@example.com"}}));
    REQUIRE_FALSE(saved.has_value());
    REQUIRE(saved.error().code == ErrorCode::InvalidInput);
}
