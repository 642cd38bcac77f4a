#include "lucent/cli.hpp"

int main(int argc, char *argv[])
{
    return lucent::cli::run(argc, argv);
}
