#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace lucent
{

    /** One route or command declared in a routing file. */
    struct RouteDeclaration
    {
        bool is_command{false};
        std::string method; // HTTP verb; "CLI" for commands
        std::string pattern;
        std::string controller;
        std::string action;
        std::vector<std::string> middleware; // aliases resolved by the application
    };

    /**
     * Reads route declarations from TOML:
     *
     *   [[route]]
     *   method = "GET"
     *   path = "/users/{user}"
     *   controller = "UserController"
     *   action = "show"
     *   middleware = ["auth"]
     *
     *   [[command]]
     *   pattern = "user show {user}"
     *   controller = "UserCommands"
     *   action = "show"
     */
    class RouteLoader
    {
    public:
        static Result<std::vector<RouteDeclaration>> load(const std::string &path);

        static Result<std::vector<RouteDeclaration>> from_string(const std::string &toml_content);
    };

} // namespace lucent
