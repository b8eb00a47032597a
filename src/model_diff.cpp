#include <iostream>

#include <modeldiff/cli/model_diff.h>

int
main(int argc, char const* const* argv)
{
    return modeldiff::run_model_diff(argc, argv, std::cout, std::cerr);
}
