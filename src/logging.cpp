#include "lucent/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace lucent
{

    void configure_logging(const LoggingConfig &cfg)
    {
        std::vector<spdlog::sink_ptr> sinks;

        if (cfg.output == "console" || cfg.output == "all")
        {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }

        if (cfg.output == "file" || cfg.output == "all")
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file_path));
        }

        auto level = spdlog::level::from_str(cfg.level);
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            level = spdlog::level::off;
        }

        auto logger = std::make_shared<spdlog::logger>("lucent", sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::err);
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    }

} // namespace lucent
