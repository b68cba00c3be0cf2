#include <sandpit/cli/cli.h>

int main(int argc, char** argv)
{
    return sandpit::cli::run(argc, argv);
}
