#include "lucent/config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <toml++/toml.h>

namespace lucent
{
    namespace
    {
        std::vector<std::string> string_array(const toml::node_view<const toml::node> &node)
        {
            std::vector<std::string> out;
            if (auto arr = node.as_array())
            {
                for (const auto &elem : *arr)
                {
                    if (auto s = elem.value<std::string>())
                        out.push_back(*s);
                }
            }
            return out;
        }

        AppConfig parse_toml(const toml::table &tbl, AppConfig cfg)
        {
            if (auto app = tbl["app"].as_table())
            {
                if (auto name = (*app)["name"].value<std::string>())
                    cfg.name = *name;
                if (auto env = (*app)["environment"].value<std::string>())
                    cfg.environment = *env;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
                if (auto output = (*logging)["output"].value<std::string>())
                    cfg.logging.output = *output;
                if (auto path = (*logging)["file_path"].value<std::string>())
                    cfg.logging.file_path = *path;
            }

            if (auto storage = tbl["storage"].as_table())
            {
                if (auto path = (*storage)["rocksdb_path"].value<std::string>())
                    cfg.storage.rocksdb_path = *path;
                if (auto create = (*storage)["create_if_missing"].value<bool>())
                    cfg.storage.create_if_missing = *create;
            }

            if (tbl["routing"].as_table())
            {
                auto routing = tbl["routing"];
                if (routing["routes"].as_array())
                    cfg.routing.route_files = string_array(routing["routes"]);
                if (routing["commands"].as_array())
                    cfg.routing.command_files = string_array(routing["commands"]);
            }

            return cfg;
        }

    } // namespace

    Result<AppConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(LucentError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<AppConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        AppConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            cfg = parse_toml(tbl, cfg);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(LucentError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        apply_env_overrides(cfg);
        return cfg;
    }

    void ConfigLoader::apply_env_overrides(AppConfig &cfg)
    {
        if (const char *name = std::getenv("LUCENT_APP_NAME"))
            cfg.name = name;
        if (const char *env = std::getenv("LUCENT_ENV"))
            cfg.environment = env;
        if (const char *level = std::getenv("LUCENT_LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *output = std::getenv("LUCENT_LOG_OUTPUT"))
            cfg.logging.output = output;
        if (const char *file = std::getenv("LUCENT_LOG_FILE"))
            cfg.logging.file_path = file;
        if (const char *path = std::getenv("LUCENT_ROCKSDB_PATH"))
            cfg.storage.rocksdb_path = path;
    }

    nlohmann::json ConfigLoader::to_json(const AppConfig &cfg)
    {
        nlohmann::json j;
        j["app"] = {{"name", cfg.name}, {"environment", cfg.environment}};
        j["logging"] = {
            {"level", cfg.logging.level},
            {"output", cfg.logging.output},
            {"file_path", cfg.logging.file_path}};
        j["storage"] = {
            {"rocksdb_path", cfg.storage.rocksdb_path},
            {"create_if_missing", cfg.storage.create_if_missing}};
        j["routing"] = {
            {"routes", cfg.routing.route_files},
            {"commands", cfg.routing.command_files}};
        return j;
    }

} // namespace lucent
