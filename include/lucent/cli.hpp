#pragma once

namespace lucent::cli
{

    /**
     * Entry point of the lucent executable:
     *   lucent [--config FILE] <command tokens...>
     *   lucent [--config FILE] request --method M --path P [--body B] [--header "Name: value"]...
     *   lucent [--config FILE] config-print
     */
    int run(int argc, char *argv[]);

} // namespace lucent::cli
