#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lucent
{

    struct StorageConfig
    {
        std::string rocksdb_path{"./data/rocksdb"};
        bool create_if_missing{true};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        std::string output{"console"}; // console | file | all | off
        std::string file_path{"./logs/lucent.log"};
    };

    struct RoutingConfig
    {
        std::vector<std::string> route_files;
        std::vector<std::string> command_files;
    };

    struct AppConfig
    {
        std::string name{"lucent"};
        std::string environment{"production"};
        LoggingConfig logging{};
        StorageConfig storage{};
        RoutingConfig routing{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides. Missing
     * tables keep their defaults; LUCENT_* environment variables take
     * precedence over file values.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<AppConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<AppConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for debugging/inspection. */
        static nlohmann::json to_json(const AppConfig &cfg);

    private:
        static void apply_env_overrides(AppConfig &cfg);
    };

} // namespace lucent
