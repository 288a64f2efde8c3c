#include "btprint_cli.hpp"

int main(int argc, char *argv[])
{
    return btprint::realMain(argc, argv);
}
