// =============================================================================
// keyprobe - sequential checksum key verification
// =============================================================================
//
// Usage:
//   keyprobe [--config <file>] [--url <endpoint>] [--verbose] [<report-file>]
//
// Reads "<path>,<checksum>" records from the report file, submits every
// checksum twice to the lookup service and stops at the first checksum whose
// two answers carry the same key. Checksums whose lookup failed are appended
// to failed.txt next to the report file.
//
// =============================================================================

#include "keyprobe/config.hpp"
#include "keyprobe/console.hpp"
#include "keyprobe/error.hpp"
#include "keyprobe/http_client.hpp"
#include "keyprobe/logging.hpp"
#include "keyprobe/lookup_client.hpp"
#include "keyprobe/search.hpp"
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

namespace {

struct Options {
    std::string config_file = "config.yaml";
    std::string service_url;
    std::string report_path;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] [<report-file>]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config <file>   Configuration file (default: config.yaml)\n"
              << "  -u, --url <endpoint>  Lookup service URL, overrides configuration\n"
              << "  -v, --verbose         Debug logging\n"
              << "  -h, --help            Show this help\n"
              << "\n"
              << "Without <report-file> the path is read from standard input.\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            options.help = true;
        } else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            options.verbose = true;
        } else if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--config") == 0) {
            KEYPROBE_CHECK_ARGUMENT(i + 1 < argc, std::string("Missing value for ") + arg);
            options.config_file = argv[++i];
        } else if (std::strcmp(arg, "-u") == 0 || std::strcmp(arg, "--url") == 0) {
            KEYPROBE_CHECK_ARGUMENT(i + 1 < argc, std::string("Missing value for ") + arg);
            options.service_url = argv[++i];
        } else if (arg[0] == '-' && arg[1] != '\0') {
            throw keyprobe::InvalidArgumentError(std::string("Unknown option: ") + arg, "parse_args");
        } else {
            KEYPROBE_CHECK_ARGUMENT(options.report_path.empty(), std::string("Unexpected argument: ") + arg);
            options.report_path = arg;
        }
    }

    return options;
}

int run(const Options& options) {
    using namespace keyprobe;

    Config config = load_config(options.config_file);
    if (!options.service_url.empty()) {
        config.service.url = options.service_url;
    }

    Logger& logger = Logger::getInstance();
    logger.set_level(options.verbose ? LogLevel::DEBUG : parse_log_level(config.logging.level));
    logger.set_output_file(config.logging.file);

    Endpoint endpoint = parse_endpoint(config.service.url);
    LOG_DEBUG("Lookup endpoint: " + endpoint.to_string());

    ConsoleReporter reporter(std::cout);

    std::string report_path = options.report_path;
    if (report_path.empty()) {
        report_path = reporter.prompt_report_path(std::cin);
    }

    auto http_client = std::make_shared<HttpClient>();
    auto lookup_client = std::make_shared<ChecksumLookupClient>(http_client, endpoint);

    run_search(config, report_path, lookup_client, reporter);

    logger.flush();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        Options options = parse_args(argc, argv);
        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }
        return run(options);

    } catch (const keyprobe::InvalidArgumentError& e) {
        std::cerr << "\n" << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cout << std::endl;
        LOG_CRITICAL(std::string("An error occurred in the main process: ") + e.what());
        keyprobe::Logger::getInstance().flush();
        return 1;
    }
}
