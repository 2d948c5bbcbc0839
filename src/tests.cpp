#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest.h>

#include "colormaps.hpp"

int main(int argc, char** argv)
{
    // views and colormaps need a table to start with
    loadDefaultColorTables();

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
