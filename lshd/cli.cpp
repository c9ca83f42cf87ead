#include "include/cli.hpp"
#include "include/catalog.hpp"
#include "include/report.hpp"
#include <string>
#include <exception>
#include <getopt.h>

static void printUsage(std::ostream& out) {
    out << "Usage: lshd [OPTIONS]\n\n";
    out << "List installable hard drives as \"<name> <size in bytes>\" lines.\n\n";
    out << "Options:\n";
    out << "  -j, --json      Print the list as a JSON array\n";
    out << "  -v, --verbose   Explain on stderr why each device is kept or skipped\n";
    out << "  -h, --help      Show this help\n";
}

int runLshd(BlockDeviceEnumerator& enumerator, int argc, char* argv[],
            std::ostream& out, std::ostream& err) {
    static const struct option longOptions[] = {
        {"json",    no_argument, nullptr, 'j'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help",    no_argument, nullptr, 'h'},
        {nullptr,   0,           nullptr, 0}
    };

    ReportFormat format = ReportFormat::TEXT;
    bool verbose = false;

    // 0 makes glibc reinitialize getopt for repeated calls
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "jvh", longOptions, nullptr)) != -1) {
        switch (opt) {
            case 'j':
                format = ReportFormat::JSON;
                break;
            case 'v':
                verbose = true;
                break;
            case 'h':
                printUsage(out);
                return 0;
            default:
                err << "Error: unrecognized option\n";
                printUsage(err);
                return 2;
        }
    }
    if (optind < argc) {
        err << "Error: unexpected argument '" << argv[optind] << "'\n";
        printUsage(err);
        return 2;
    }

    enumerator.setVerbose(verbose);

    // Nothing reaches out unless the whole catalog was built
    std::string report;
    try {
        report = formatCatalog(buildCatalog(enumerator, verbose), format);
    } catch (const EnumerationError& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        err << "Error: failed to build device list: " << e.what() << std::endl;
        return 1;
    }

    out << report << std::flush;
    if (!out) {
        err << "Error: failed to write device list" << std::endl;
        return 1;
    }
    return 0;
}
