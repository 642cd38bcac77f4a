#pragma once

#include "types.hpp"
#include "binder.hpp"
#include "config.hpp"
#include "entity.hpp"
#include "entity_store.hpp"
#include "handler.hpp"
#include "middleware.hpp"
#include "request_context.hpp"
#include "response.hpp"
#include "route_loader.hpp"
#include "route_table.hpp"
#include "service_registry.hpp"
#include "validation.hpp"
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lucent
{

    /** Request kind under which commands are registered. */
    inline constexpr const char *kCommandKind = "CLI";

    /** Command-line arguments split into positional tokens and --options. */
    struct ProcessedArguments
    {
        std::vector<std::string> positional;
        nlohmann::json options = nlohmann::json::object();
    };

    /**
     * Split process arguments: "--key=value" becomes a string option, a bare
     * "--flag" becomes true, everything else is a positional token.
     */
    ProcessedArguments process_arguments(const std::vector<std::string> &args);

    /**
     * The application object and dispatcher. Owns the route tables, registries
     * and rule catalog. Registration happens before boot(), which must be
     * called once from a single thread; after it the instance is read-only
     * and may dispatch concurrently.
     */
    class Application
    {
    public:
        explicit Application(AppConfig config = {});
        Application(const Application &) = delete;
        Application &operator=(const Application &) = delete;

        const AppConfig &config() const { return config_; }

        ServiceRegistry &services() { return services_; }
        EntityRegistry &entities() { return entities_; }
        HandlerRegistry &handlers() { return handlers_; }
        RuleCatalog &rules() { return *rules_; }
        std::shared_ptr<const RuleCatalog> rule_catalog() const { return rules_; }

        RouteTable &http_routes() { return http_; }
        RouteTable &commands() { return cli_; }

        void set_entity_store(std::shared_ptr<EntityStore> store);
        std::shared_ptr<EntityStore> entity_store() const { return store_; }

        Result<void> register_route(const std::string &method,
                                    std::string_view pattern,
                                    const std::string &controller,
                                    const std::string &action,
                                    std::vector<MiddlewarePtr> middleware = {});

        Result<void> register_command(std::string_view pattern,
                                      const std::string &controller,
                                      const std::string &action,
                                      std::vector<MiddlewarePtr> middleware = {});

        /** Middleware run before the route's own for every HTTP request. */
        void register_global_middleware(MiddlewarePtr middleware);

        /** Name under which routing files may reference a middleware. */
        void alias_middleware(const std::string &name, MiddlewarePtr middleware);

        /** Response returned when no HTTP route matches. */
        void register_fallback(Response response);

        /** Replaces the generic JSON error body for one status code. */
        void register_error_template(int status, Response response);

        /**
         * Load the routing files named in the config, register the built-in
         * help command and expose the rule catalog as a service. Calling it
         * again after a successful boot does nothing.
         */
        Result<void> boot();

        /**
         * Drop every registration made since construction: routes, commands,
         * handlers, services, entity types, middleware, fallback, error
         * templates and custom rule operations, patterns and messages. The
         * config and the entity store are kept.
         */
        void teardown();

        bool booted() const { return booted_; }

        /**
         * Dispatch one HTTP request. Fails with InternalError before boot().
         * Route misses, binding failures and
         * unresolvable handlers become error responses; rule engine and
         * storage errors, and errors returned by the handler, are returned
         * as a failed Result.
         */
        Result<Response> handle(const HttpRequest &request);

        /**
         * Dispatch one command. Fails with InternalError before boot().
         * Usage problems are reported as text in the
         * successful result; only rule engine, storage and handler errors fail.
         */
        Result<std::string> run_command(const std::vector<std::string> &args);

    private:
        Result<void> register_declaration(const RouteDeclaration &decl);
        Result<void> load_routing_file(const std::string &path);
        Response error_response(int status, const std::string &message = {}) const;
        ParameterBinder binder() const;

        AppConfig config_;
        RouteTable http_{PatternStyle::Path};
        RouteTable cli_{PatternStyle::Command};
        ServiceRegistry services_;
        EntityRegistry entities_;
        HandlerRegistry handlers_;
        std::shared_ptr<RuleCatalog> rules_;
        std::shared_ptr<EntityStore> store_;
        std::vector<MiddlewarePtr> global_middleware_;
        std::unordered_map<std::string, MiddlewarePtr> middleware_aliases_;
        std::optional<Response> fallback_;
        std::map<int, Response> error_templates_;
        bool booted_{false};
    };

} // namespace lucent
