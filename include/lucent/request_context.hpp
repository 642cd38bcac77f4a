#pragma once

#include "entity.hpp"
#include "pattern.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <utility>

namespace lucent
{

    /** A transport-neutral HTTP request handed to the dispatcher. */
    struct HttpRequest
    {
        std::string method{"GET"};
        std::string target{"/"}; // path with optional query string
        std::unordered_map<std::string, std::string> headers;
        std::string body;
    };

    /** Metadata of the route that matched the current request. */
    struct RouteInfo
    {
        std::string controller;
        std::string action;
        std::string pattern;
        std::string verb; // HTTP method or "CLI"
        CapturedVariables variables;
    };

    /**
     * Per-request scratch store of entities keyed by (name, entity type).
     * Later stashes under the same key overwrite earlier ones.
     *
     * Route-model binding stashes under the handler parameter's name, e.g.
     * ("user", "User"). The "unique" and "exists" rules stash under the table
     * they name, which is the entity type, e.g. ("User", "User"). Binding
     * checks both keys and reuses an entry whose primary key matches the
     * captured value, so a validated entity is not fetched twice.
     */
    class EntityCache
    {
    public:
        void put(const std::string &name, Entity entity);

        const Entity *find(const std::string &name, const std::string &type) const;

        std::size_t size() const { return entries_.size(); }

    private:
        std::map<std::pair<std::string, std::string>, Entity> entries_;
    };

    /**
     * Mutable request-scoped state. Created once per dispatch and owned by the
     * dispatcher until the response is produced; never shared between requests.
     */
    struct RequestContext
    {
        std::string method;
        std::string path;
        std::unordered_map<std::string, std::string> headers;
        std::unordered_map<std::string, std::string> input; // query parameters
        std::string body;

        CapturedVariables variables;                        // URL or command variables
        nlohmann::json options = nlohmann::json::object(); // command --options
        nlohmann::json context = nlohmann::json::object(); // free-form middleware state
        EntityCache entities;
        RouteInfo route;

        static RequestContext from_http(const HttpRequest &request);

        std::optional<std::string> header(const std::string &name) const;
    };

} // namespace lucent
