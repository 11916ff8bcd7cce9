#include "cli/cli.h"

int main(int argc, char** argv)
{
    return keyscope::cli_main(argc, argv);
}
