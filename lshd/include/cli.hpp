#ifndef LSHD_CLI_HPP
#define LSHD_CLI_HPP

#include <ostream>
#include "dev.hpp"

// Parses options, builds the catalog and writes it to out.
// Returns 0 on success, 1 when the catalog could not be built or written,
// 2 on a usage error. Nothing is written to out unless the build succeeded.
int runLshd(BlockDeviceEnumerator& enumerator, int argc, char* argv[],
            std::ostream& out, std::ostream& err);

#endif
