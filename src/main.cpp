#include "ari/cli.hpp"

int main(int argc, char *argv[])
{
    return ari::cli::run(argc, argv);
}
