#include <catch2/catch_test_macros.hpp>
#include "lucent/application.hpp"
#include "lucent/demo.hpp"
#include "in_memory_entity_store.hpp"
#include <filesystem>
#include <fstream>

using namespace lucent;
using lucent::testing::InMemoryEntityStore;

namespace
{
    class ArticleController : public Controller
    {
    public:
        Result<Response> show(BoundArguments &args)
        {
            auto &request = args.context();
            nlohmann::json body = args.entity("article").attributes;
            body["trail"] = request.context.value("trail", nlohmann::json::array());
            return Response::json(200, body);
        }

        Result<Response> page(BoundArguments &args)
        {
            return Response::text(200, "page " + std::to_string(args.integer("n")));
        }

        Result<Response> broken(BoundArguments &)
        {
            return std::unexpected(LucentError::internal("handler exploded"));
        }
    };

    class MigrationCommands : public Controller
    {
    public:
        Result<std::string> make(BoundArguments &args)
        {
            std::string out = "Created migration " + args.string("class");
            if (args.value("options").value("force", false))
                out += " (forced)";
            return out;
        }

        Result<std::string> copy(BoundArguments &args)
        {
            return "Copied " + args.string("from") + " to " + args.string("to");
        }
    };

    MiddlewarePtr tagging(const std::string &tag)
    {
        return std::make_shared<FunctionMiddleware>(tag, [tag](RequestContext ctx) {
            ctx.context["trail"].push_back(tag);
            return ctx;
        });
    }

    struct AppFixture
    {
        AppFixture()
        {
            app.set_entity_store(store);
            app.entities().add("Article", "id");
            store->add("Article", {{"id", 5}, {"title", "Routing"}});

            app.handlers()
                .controller<ArticleController>("ArticleController")
                .action("show", {ParamDescriptor::context("request"), ParamDescriptor::entity("article", "Article")},
                        &ArticleController::show)
                .action("page", {ParamDescriptor::scalar("n", ScalarType::Integer)}, &ArticleController::page)
                .action("broken", {}, &ArticleController::broken);

            app.handlers()
                .controller<MigrationCommands>("MigrationCommands")
                .command("make",
                         {ParamDescriptor::scalar("class"),
                          ParamDescriptor::scalar("options", ScalarType::Any, nlohmann::json::object())},
                         &MigrationCommands::make)
                .command("copy", {ParamDescriptor::scalar("from"), ParamDescriptor::scalar("to")},
                         &MigrationCommands::copy);

            app.register_global_middleware(tagging("global"));
            REQUIRE(app.register_route("GET", "/articles/{article}", "ArticleController", "show", {tagging("route")}).has_value());
            REQUIRE(app.register_route("GET", "/pages/{n}", "ArticleController", "page").has_value());
            REQUIRE(app.register_route("GET", "/missing-action", "ArticleController", "nothing").has_value());
            REQUIRE(app.register_route("GET", "/missing-controller", "GhostController", "index").has_value());
            REQUIRE(app.register_route("GET", "/broken", "ArticleController", "broken").has_value());

            REQUIRE(app.register_command("Migration make {class}", "MigrationCommands", "make").has_value());
            REQUIRE(app.register_command("copy {from}", "MigrationCommands", "copy").has_value());
            REQUIRE(app.register_command("ghost run", "GhostCommands", "run").has_value());
            REQUIRE(app.register_command("migration nothing", "MigrationCommands", "nothing").has_value());
            REQUIRE(app.boot().has_value());
        }

        Response get(const std::string &target)
        {
            auto res = app.handle(HttpRequest{"GET", target, {}, ""});
            REQUIRE(res.has_value());
            return *res;
        }

        std::string command(std::vector<std::string> args)
        {
            auto out = app.run_command(args);
            REQUIRE(out.has_value());
            return *out;
        }

        std::shared_ptr<InMemoryEntityStore> store = std::make_shared<InMemoryEntityStore>();
        Application app;
    };
}

TEST_CASE("HTTP dispatch binds entities and runs middleware in order", "[application][http]")
{
    AppFixture f;
    auto res = f.get("/articles/5");
    REQUIRE(res.status == 200);
    REQUIRE(res.headers.at("Content-Type") == "application/json");

    auto body = nlohmann::json::parse(res.body);
    REQUIRE(body["title"] == "Routing");
    REQUIRE(body["trail"] == nlohmann::json::array({"global", "route"}));
}

TEST_CASE("HTTP dispatch coerces captured scalars", "[application][http]")
{
    AppFixture f;
    auto res = f.get("/pages/12?ignored=1");
    REQUIRE(res.status == 200);
    REQUIRE(res.body == "page 12");
}

TEST_CASE("HTTP failures map to error responses", "[application][http]")
{
    AppFixture f;

    SECTION("unknown route is a 404 with the framework body")
    {
        auto res = f.get("/nowhere");
        REQUIRE(res.status == 404);
        auto body = nlohmann::json::parse(res.body);
        REQUIRE(body["outcome"] == false);
        REQUIRE(body["status"] == 404);
        REQUIRE(body["message"] == default_error_message(404));
    }

    SECTION("a registered fallback replaces the 404")
    {
        f.app.register_fallback(Response::text(200, "fallback"));
        REQUIRE(f.get("/nowhere").body == "fallback");
    }

    SECTION("unknown entity key is a 404")
    {
        REQUIRE(f.get("/articles/999").status == 404);
    }

    SECTION("error templates replace generic bodies")
    {
        f.app.register_error_template(404, Response::text(0, "custom not found"));
        auto res = f.get("/articles/999");
        REQUIRE(res.status == 404);
        REQUIRE(res.body == "custom not found");
    }

    SECTION("missing controller or action is a 500")
    {
        REQUIRE(f.get("/missing-controller").status == 500);
        REQUIRE(f.get("/missing-action").status == 500);
    }

    SECTION("handler errors propagate")
    {
        auto res = f.app.handle(HttpRequest{"GET", "/broken", {}, ""});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::InternalError);
    }

    SECTION("entity store errors propagate")
    {
        f.store->fail_next = true;
        auto res = f.app.handle(HttpRequest{"GET", "/articles/5", {}, ""});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::StorageError);
    }
}

TEST_CASE("Command dispatch runs the matched handler", "[application][command]")
{
    AppFixture f;
    REQUIRE(f.command({"Migration", "make", "CreateUsers"}) == "Created migration CreateUsers");
    REQUIRE(f.command({"Migration", "make", "CreateUsers", "--force"}) == "Created migration CreateUsers (forced)");
}

TEST_CASE("Command failures are reported as text", "[application][command]")
{
    AppFixture f;

    REQUIRE(f.command({"Migration", "drop"}) ==
            "Unrecognized command. Type 'help' to see available commands.\nDid you mean something similar?");

    REQUIRE(f.command({"ghost", "run"}) ==
            "Command registration error: The controller class 'GhostCommands' could not be found.\n"
            "Please check your command registration and ensure the class exists.");

    REQUIRE(f.command({"migration", "nothing"}) ==
            "Invalid command: The method 'nothing' is not defined in the 'MigrationCommands' class.\n"
            "Please verify the command registration and the controller's method.");
}

TEST_CASE("Commands with too few positional tokens report usage", "[application][command]")
{
    AppFixture f;
    auto out = f.command({"copy", "a.txt"});
    REQUIRE(out == "Insufficient arguments! The command requires at least 2 parameters.\n"
                   "Usage: copy {from} [from] [to]");
}

TEST_CASE("The built-in help command lists registered commands", "[application][command]")
{
    AppFixture f;
    auto out = f.command({"help"});
    REQUIRE(out.starts_with("Available commands:"));
    REQUIRE(out.find("Migration make {class}") != std::string::npos);
    REQUIRE(out.find("copy {from}") != std::string::npos);
}

TEST_CASE("Arguments split into positional tokens and options", "[application][command]")
{
    auto processed = process_arguments({"user", "add", "--name=Ada Lovelace", "--verbose", "ada@example.com"});
    REQUIRE(processed.positional == std::vector<std::string>{"user", "add", "ada@example.com"});
    REQUIRE(processed.options["name"] == "Ada Lovelace");
    REQUIRE(processed.options["verbose"] == true);
}

TEST_CASE("Boot loads routing files and resolves middleware aliases", "[application][boot]")
{
    auto path = std::filesystem::temp_directory_path() / "lucent_test_routes.toml";
    {
        std::ofstream out(path);
        out << "[[route]]\nmethod = \"GET\"\npath = \"/pages/{n}\"\ncontroller = \"ArticleController\"\n"
               "action = \"page\"\nmiddleware = [\"audit\"]\n";
    }

    AppConfig cfg;
    cfg.routing.route_files = {path.string()};

    SECTION("known alias")
    {
        Application app(cfg);
        app.handlers()
            .controller<ArticleController>("ArticleController")
            .action("page", {ParamDescriptor::scalar("n", ScalarType::Integer)}, &ArticleController::page);
        app.alias_middleware("audit", tagging("audit"));

        REQUIRE(app.boot().has_value());
        REQUIRE(app.booted());
        REQUIRE(app.boot().has_value());
        REQUIRE(app.http_routes().entries("GET").size() == 1);
        REQUIRE(app.services().contains("RuleCatalog"));

        auto res = app.handle(HttpRequest{"GET", "/pages/3", {}, ""});
        REQUIRE(res.has_value());
        REQUIRE(res->body == "page 3");

        app.entities().add("Article", "id");
        REQUIRE(app.rules().add_regex("slug", "^[a-z-]+$").has_value());

        app.teardown();
        REQUIRE_FALSE(app.booted());
        REQUIRE(app.http_routes().entries("GET").empty());
        REQUIRE_FALSE(app.entities().contains("Article"));
        REQUIRE(app.rules().regex("slug") == nullptr);
        REQUIRE(app.rules().regex("email") != nullptr);

        auto after = app.handle(HttpRequest{"GET", "/pages/3", {}, ""});
        REQUIRE_FALSE(after.has_value());
        REQUIRE(after.error().code == ErrorCode::InternalError);
    }

    SECTION("unknown alias")
    {
        Application app(cfg);
        auto booted = app.boot();
        REQUIRE_FALSE(booted.has_value());
        REQUIRE(booted.error().code == ErrorCode::ConfigError);
    }

    std::filesystem::remove(path);
}

TEST_CASE("Dispatch before boot is an error", "[application][boot]")
{
    Application app;
    REQUIRE(app.register_command("copy {from}", "MigrationCommands", "copy").has_value());

    auto res = app.handle(HttpRequest{"GET", "/anything", {}, ""});
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::InternalError);

    auto out = app.run_command({"copy", "a.txt"});
    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().code == ErrorCode::InternalError);
    REQUIRE_FALSE(app.booted());
}

TEST_CASE("Demo application wires users end to end", "[application][demo]")
{
    auto store = std::make_shared<InMemoryEntityStore>();
    Application app;
    app.set_entity_store(store);
    REQUIRE(demo::install(app).has_value());
    REQUIRE(app.boot().has_value());

    auto created = app.handle(HttpRequest{"POST", "/users", {}, R"({"email": "ada@example.com", "name": "Ada"})"});
    REQUIRE(created.has_value());
    REQUIRE(created->status == 201);
    REQUIRE(nlohmann::json::parse(created->body)["id"] == 1);

    auto duplicate = app.handle(HttpRequest{"POST", "/users", {}, R"({"email": "ada@example.com"})"});
    REQUIRE(duplicate.has_value());
    REQUIRE(duplicate->status == 422);
    REQUIRE(nlohmann::json::parse(duplicate->body)["errors"].contains("email"));

    auto invalid = app.handle(HttpRequest{"POST", "/users", {}, "not json"});
    REQUIRE(invalid.has_value());
    REQUIRE(invalid->status == 400);

    auto shown = app.handle(HttpRequest{"GET", "/users/1", {}, ""});
    REQUIRE(shown.has_value());
    REQUIRE(shown->status == 200);
    REQUIRE(nlohmann::json::parse(shown->body)["email"] == "ada@example.com");

    REQUIRE(app.handle(HttpRequest{"GET", "/users/2", {}, ""})->status == 404);

    auto added = app.run_command({"user", "add", "grace@example.com", "--name=Grace"});
    REQUIRE(added.has_value());
    REQUIRE(*added == "Created user 2");

    auto rejected = app.run_command({"user", "add", "not-an-email"});
    REQUIRE(rejected.has_value());
    REQUIRE(rejected->starts_with("Validation failed:"));

    auto listed = app.run_command({"user", "show", "2"});
    REQUIRE(listed.has_value());
    REQUIRE(listed->find("grace@example.com") != std::string::npos);
}
