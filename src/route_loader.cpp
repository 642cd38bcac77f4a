#include "lucent/route_loader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <toml++/toml.h>

namespace lucent
{
    namespace
    {
        Result<std::string> required_string(const toml::table &entry,
                                            std::string_view key,
                                            const std::string &where)
        {
            auto value = entry[key].value<std::string>();
            if (!value || value->empty())
            {
                return std::unexpected(LucentError::parsing(where + " is missing string field '" +
                                                            std::string(key) + "'"));
            }
            return *value;
        }

        Result<std::vector<std::string>> middleware_names(const toml::table &entry, const std::string &where)
        {
            std::vector<std::string> names;
            auto node = entry["middleware"];
            if (!node)
                return names;
            auto arr = node.as_array();
            if (!arr)
                return std::unexpected(LucentError::parsing(where + " has a non-array 'middleware' field"));
            for (const auto &elem : *arr)
            {
                auto name = elem.value<std::string>();
                if (!name)
                    return std::unexpected(LucentError::parsing(where + " lists a non-string middleware name"));
                names.push_back(*name);
            }
            return names;
        }

        Result<RouteDeclaration> parse_entry(const toml::node &node, bool is_command, std::size_t index)
        {
            std::string where = std::string(is_command ? "command" : "route") + " #" + std::to_string(index);
            auto entry = node.as_table();
            if (!entry)
                return std::unexpected(LucentError::parsing(where + " is not a table"));

            RouteDeclaration decl;
            decl.is_command = is_command;

            if (is_command)
            {
                decl.method = "CLI";
                auto pattern = required_string(*entry, "pattern", where);
                if (!pattern)
                    return std::unexpected(pattern.error());
                decl.pattern = std::move(*pattern);
            }
            else
            {
                auto method = required_string(*entry, "method", where);
                if (!method)
                    return std::unexpected(method.error());
                decl.method = std::move(*method);
                std::transform(decl.method.begin(), decl.method.end(), decl.method.begin(),
                               [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
                auto path = required_string(*entry, "path", where);
                if (!path)
                    return std::unexpected(path.error());
                decl.pattern = std::move(*path);
            }

            auto controller = required_string(*entry, "controller", where);
            if (!controller)
                return std::unexpected(controller.error());
            decl.controller = std::move(*controller);

            auto action = required_string(*entry, "action", where);
            if (!action)
                return std::unexpected(action.error());
            decl.action = std::move(*action);

            auto middleware = middleware_names(*entry, where);
            if (!middleware)
                return std::unexpected(middleware.error());
            decl.middleware = std::move(*middleware);

            return decl;
        }

        Result<void> parse_section(const toml::table &tbl,
                                   std::string_view key,
                                   bool is_command,
                                   std::vector<RouteDeclaration> &out)
        {
            auto node = tbl[key];
            if (!node)
                return {};
            auto arr = node.as_array();
            if (!arr)
            {
                return std::unexpected(LucentError::parsing("'" + std::string(key) +
                                                            "' must be an array of tables"));
            }
            for (std::size_t i = 0; i < arr->size(); ++i)
            {
                auto decl = parse_entry(*arr->get(i), is_command, i);
                if (!decl)
                    return std::unexpected(decl.error());
                out.push_back(std::move(*decl));
            }
            return {};
        }

    } // namespace

    Result<std::vector<RouteDeclaration>> RouteLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(LucentError::config("Unable to open routing file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<std::vector<RouteDeclaration>> RouteLoader::from_string(const std::string &toml_content)
    {
        std::vector<RouteDeclaration> out;
        try
        {
            auto tbl = toml::parse(toml_content);

            auto routes = parse_section(tbl, "route", false, out);
            if (!routes)
                return std::unexpected(routes.error());
            auto commands = parse_section(tbl, "command", true, out);
            if (!commands)
                return std::unexpected(commands.error());
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(LucentError::parsing(std::string("Failed to parse routing TOML: ") + e.what()));
        }
        return out;
    }

} // namespace lucent
