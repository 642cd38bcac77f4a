#pragma once

#include "config.hpp"

namespace lucent
{

    /**
     * Install the process-wide "lucent" spdlog logger described by cfg:
     * console sink, file sink, both, or a null sink when output is "off".
     */
    void configure_logging(const LoggingConfig &cfg);

} // namespace lucent
