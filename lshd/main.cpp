#include <iostream>
#include "include/dev.hpp"
#include "include/cli.hpp"

int main(int argc, char* argv[]) {
    SysfsEnumerator enumerator;

    return runLshd(enumerator, argc, argv, std::cout, std::cerr);
}
