#include <catch2/catch_test_macros.hpp>
#include "lucent/binder.hpp"
#include "in_memory_entity_store.hpp"

using namespace lucent;
using lucent::testing::InMemoryEntityStore;

namespace
{
    struct Mailer
    {
        std::string from{"noreply@example.com"};
    };

    struct BinderFixture
    {
        BinderFixture()
        {
            entities.add("User", "id");
            entities.add("Post", "slug");
            services.add<Mailer>("Mailer", std::make_shared<Mailer>());
            store->add("User", {{"id", 1}, {"email", "ada@example.com"}});
            store->add("Post", {{"slug", "hello"}, {"title", "Hello"}}, "slug");

            context.route.controller = "UserController";
            context.route.action = "show";
            context.route.pattern = "/users/{user}";
        }

        ServiceRegistry services;
        EntityRegistry entities;
        std::shared_ptr<InMemoryEntityStore> store = std::make_shared<InMemoryEntityStore>();
        RequestContext context;

        ParameterBinder binder() { return ParameterBinder(services, entities, store); }
    };
}

TEST_CASE("Scalars bind from captured variables with coercion", "[binder]")
{
    BinderFixture f;
    f.context.variables = {{"id", "42"}, {"ratio", "0.5"}, {"active", "0"}, {"name", "ada"}};

    auto args = f.binder().bind({ParamDescriptor::scalar("id", ScalarType::Integer),
                                 ParamDescriptor::scalar("ratio", ScalarType::Float),
                                 ParamDescriptor::scalar("active", ScalarType::Boolean),
                                 ParamDescriptor::scalar("name")},
                                f.context, BindMode::Http);
    REQUIRE(args.has_value());
    REQUIRE(args->integer("id") == 42);
    REQUIRE(args->number("ratio") == 0.5);
    REQUIRE_FALSE(args->boolean("active"));
    REQUIRE(args->string("name") == "ada");
    REQUIRE(args->names() == std::vector<std::string>{"id", "ratio", "active", "name"});
}

TEST_CASE("Missing scalars use defaults or fail naming the parameter", "[binder]")
{
    BinderFixture f;

    SECTION("default is used")
    {
        auto args = f.binder().bind({ParamDescriptor::scalar("page", ScalarType::Integer, 1)},
                                    f.context, BindMode::Http);
        REQUIRE(args.has_value());
        REQUIRE(args->integer("page") == 1);
    }

    SECTION("no default is a missing argument")
    {
        auto args = f.binder().bind({ParamDescriptor::scalar("page", ScalarType::Integer)},
                                    f.context, BindMode::Http);
        REQUIRE_FALSE(args.has_value());
        REQUIRE(args.error().code == ErrorCode::MissingArgument);
        REQUIRE(std::string(args.error().what()).find("'page'") != std::string::npos);
        REQUIRE(std::string(args.error().what()).find("UserController::show") != std::string::npos);
    }

    SECTION("command mode names the expected invocation")
    {
        f.context.route.pattern = "user show";
        auto args = f.binder().bind({ParamDescriptor::scalar("user")}, f.context, BindMode::Command);
        REQUIRE_FALSE(args.has_value());
        REQUIRE(std::string(args.error().what()) ==
                "Argument missing: The 'user' argument is required for this command.\n"
                "Expected format: [command] [argument_name]\n"
                "Example usage: user show [user]");
    }
}

TEST_CASE("Entity parameters bind through the store", "[binder]")
{
    BinderFixture f;

    SECTION("found entities are bound and stashed")
    {
        f.context.variables = {{"user", "1"}};
        auto args = f.binder().bind({ParamDescriptor::entity("user", "User")}, f.context, BindMode::Http);
        REQUIRE(args.has_value());
        REQUIRE(args->entity("user").field("email") == "ada@example.com");
        REQUIRE(f.context.entities.find("user", "User") != nullptr);
    }

    SECTION("custom primary keys are honoured")
    {
        f.context.variables = {{"post", "hello"}};
        auto args = f.binder().bind({ParamDescriptor::entity("post", "Post")}, f.context, BindMode::Http);
        REQUIRE(args.has_value());
        REQUIRE(args->entity("post").field("title") == "Hello");
    }

    SECTION("unknown keys are EntityNotFound")
    {
        f.context.variables = {{"user", "99"}};
        auto args = f.binder().bind({ParamDescriptor::entity("user", "User")}, f.context, BindMode::Http);
        REQUIRE_FALSE(args.has_value());
        REQUIRE(args.error().code == ErrorCode::EntityNotFound);
    }

    SECTION("storage failures propagate")
    {
        f.context.variables = {{"user", "1"}};
        f.store->fail_next = true;
        auto args = f.binder().bind({ParamDescriptor::entity("user", "User")}, f.context, BindMode::Http);
        REQUIRE_FALSE(args.has_value());
        REQUIRE(args.error().code == ErrorCode::StorageError);
    }

    SECTION("unregistered entity types cannot be resolved")
    {
        f.context.variables = {{"tag", "x"}};
        auto args = f.binder().bind({ParamDescriptor::entity("tag", "Tag")}, f.context, BindMode::Http);
        REQUIRE_FALSE(args.has_value());
        REQUIRE(args.error().code == ErrorCode::HandlerResolution);
    }
}

TEST_CASE("A cached entity with the same key is reused", "[binder]")
{
    BinderFixture f;
    f.context.variables = {{"user", "1"}};

    Entity cached;
    cached.type = "User";
    cached.attributes = {{"id", 1}, {"email", "cached@example.com"}};
    f.context.entities.put("user", cached);

    auto args = f.binder().bind({ParamDescriptor::entity("user", "User")}, f.context, BindMode::Http);
    REQUIRE(args.has_value());
    REQUIRE(args->entity("user").field("email") == "cached@example.com");
    REQUIRE(f.store->lookups == 0);

    SECTION("a different key triggers a fresh lookup")
    {
        f.context.variables = {{"user", "2"}};
        f.store->add("User", {{"id", 2}, {"email", "grace@example.com"}});
        auto fresh = f.binder().bind({ParamDescriptor::entity("user", "User")}, f.context, BindMode::Http);
        REQUIRE(fresh.has_value());
        REQUIRE(fresh->entity("user").field("email") == "grace@example.com");
        REQUIRE(f.store->lookups == 1);
    }
}

TEST_CASE("Context and services are injected", "[binder]")
{
    BinderFixture f;

    auto args = f.binder().bind({ParamDescriptor::context("request"), ParamDescriptor::service("mailer", "Mailer")},
                                f.context, BindMode::Http);
    REQUIRE(args.has_value());
    REQUIRE(&args->context() == &f.context);
    REQUIRE(args->service<Mailer>("mailer")->from == "noreply@example.com");

    SECTION("a second context parameter is rejected")
    {
        auto twice = f.binder().bind({ParamDescriptor::context("a"), ParamDescriptor::context("b")},
                                     f.context, BindMode::Http);
        REQUIRE_FALSE(twice.has_value());
        REQUIRE(twice.error().code == ErrorCode::HandlerResolution);
    }

    SECTION("an unregistered service falls back to its default")
    {
        auto p = ParamDescriptor::service("cache", "Cache");
        p.default_value = nlohmann::json();
        auto fallback = f.binder().bind({p}, f.context, BindMode::Http);
        REQUIRE(fallback.has_value());
        REQUIRE(fallback->value("cache").is_null());
    }
}

TEST_CASE("Command mode skips model binding and passes options", "[binder]")
{
    BinderFixture f;
    f.context.variables = {{"user", "1"}};
    f.context.options = {{"force", true}};

    auto args = f.binder().bind({ParamDescriptor::entity("user", "User"),
                                 ParamDescriptor::scalar("options", ScalarType::Any)},
                                f.context, BindMode::Command);
    REQUIRE(args.has_value());
    REQUIRE(args->string("user") == "1");
    REQUIRE(args->value("options").at("force") == true);
    REQUIRE(f.store->lookups == 0);
}

TEST_CASE("Constructors only receive services and defaults", "[binder]")
{
    BinderFixture f;

    auto ok = f.binder().bind_constructor("UserController", {ParamDescriptor::service("mailer", "Mailer")});
    REQUIRE(ok.has_value());
    REQUIRE(ok->service<Mailer>("mailer") != nullptr);

    auto missing = f.binder().bind_constructor("UserController", {ParamDescriptor::service("db", "Database")});
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::HandlerResolution);
}

TEST_CASE("Usage suffix lists positional parameters", "[binder]")
{
    std::vector<ParamDescriptor> params{ParamDescriptor::scalar("class"),
                                        ParamDescriptor::service("mailer", "Mailer"),
                                        ParamDescriptor::scalar("options", ScalarType::Any),
                                        ParamDescriptor::scalar("force", ScalarType::Boolean, false)};
    REQUIRE(usage_suffix(params) == " [class] [force]");
}
