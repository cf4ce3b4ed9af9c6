/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: secern.cc
 * Description: Command line application that sifts lines from standard input
 *              into the output files of the sinks declared in a YAML
 *              configuration file. Unclaimed lines pass through to standard
 *              output unless disabled. Also generates a sample configuration
 *              and validates configurations without processing data.
 */

#include "secern/config/yaml_loader.h"
#include "secern/router/line_router.h"
#include "secern/sinks/buffered_writer.h"
#include "secern/sinks/output_manager.h"
#include "secern/sinks/sink_registry.h"
#include "secern/utils/error.h"
#include "secern/utils/log.h"
#include <chrono>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <signal.h>
#include <sstream>
#include <unistd.h>

using secern::utils::log_error;
using secern::utils::log_info;

namespace {

constexpr const char* PROGRAM_NAME = "secern";
constexpr const char* PROGRAM_VERSION = "0.9.1";

struct Options {
    std::string config_file;
    std::string template_file;
    bool validate_only = false;
    bool no_stdout = false;
    bool quiet = false;
};

void print_usage(std::ostream& os) {
    os << PROGRAM_NAME << " " << PROGRAM_VERSION << "\n"
       << "Sifts lines from STDIN into output files using regex patterns defined\n"
       << "in a YAML configuration file.\n\n"
       << "Usage: " << PROGRAM_NAME << " [OPTIONS]\n\n"
       << "Options:\n"
       << "  -c, --config <FILE>        Specifies the YAML config file\n"
       << "  -g, --gen-template <FILE>  Generates an example YAML config file and exits\n"
       << "  -v, --validate-only        Validate that the config file specified by -c is correctly formed\n"
       << "  -n, --no-stdout            Disables emitting unfiltered data on STDOUT\n"
       << "  -q, --quiet                Disables info level log events (version, run time, etc) on STDERR\n"
       << "  -h, --help                 Print help\n"
       << "  -V, --version              Print version\n"
       << "\nThe SECERN_LOG environment variable (debug, info, warn, error, off)\n"
       << "overrides the default log level.\n";
}

// Returns -1 to continue, otherwise the exit code
int parse_options(int argc, char** argv, Options& options) {
    static const struct option long_options[] = {
        {"config", required_argument, nullptr, 'c'},
        {"gen-template", required_argument, nullptr, 'g'},
        {"validate-only", no_argument, nullptr, 'v'},
        {"no-stdout", no_argument, nullptr, 'n'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:g:vnqhV", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c': options.config_file = optarg; break;
            case 'g': options.template_file = optarg; break;
            case 'v': options.validate_only = true; break;
            case 'n': options.no_stdout = true; break;
            case 'q': options.quiet = true; break;
            case 'h':
                print_usage(std::cout);
                return 0;
            case 'V':
                std::cout << PROGRAM_NAME << " " << PROGRAM_VERSION << std::endl;
                return 0;
            default:
                print_usage(std::cerr);
                return 1;
        }
    }

    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n\n";
        print_usage(std::cerr);
        return 1;
    }
    return -1;
}

void report(const secern::ConfigError& e) {
    if (e.errors().size() > 1) {
        log_error(e.what());
    }
    for (const auto& error : e.errors()) {
        log_error(error);
    }
}

int process(const Options& options) {
    log_info("Loading configuration file: " + options.config_file);
    auto declarations = secern::config::load_sinks_from_yaml(options.config_file);

    auto mode = options.validate_only
        ? secern::sinks::SinkRegistry::BuildMode::kValidateOnly
        : secern::sinks::SinkRegistry::BuildMode::kCreateOutputs;
    auto registry = secern::sinks::SinkRegistry::build(declarations, mode);

    if (options.validate_only) {
        log_info("Configuration summary");
        registry.summary(std::cout);
        std::cout << "Configuration file '" << options.config_file << "' is valid" << std::endl;
        return 0;
    }

    std::unique_ptr<secern::sinks::OutputWriter> stdout_writer;
    if (!options.no_stdout) {
        stdout_writer = std::make_unique<secern::sinks::BufferedWriter>(
            STDOUT_FILENO, "STDOUT", secern::sinks::BufferedWriter::STDOUT_BUFFER_SIZE, false);
    }
    secern::sinks::OutputManager outputs(registry, std::move(stdout_writer));
    secern::router::LineRouter router(registry, outputs);

    log_info("Starting data processing.");
    auto start = std::chrono::steady_clock::now();

    auto outcome = router.run_and_flush(std::cin);
    if (outcome == secern::router::RunOutcome::kDownstreamClosed) {
        secern::utils::log_debug("STDOUT reader closed, stopping after " +
                                 std::to_string(router.stats().lines_read) + " lines");
        return 0;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    const auto& stats = router.stats();
    log_info("Ending data processing. Time elapsed was: " + std::to_string(elapsed.count()) + "ms");

    std::ostringstream counts;
    counts << "Lines read: " << stats.lines_read
           << ", passed through: " << stats.passed_through
           << ", dropped: " << stats.dropped;
    log_info(counts.str());
    for (size_t i = 0; i < registry.size(); ++i) {
        log_info("Sink '" + registry[i].name() + "' matched " +
                 std::to_string(stats.sink_matches[i]) + " lines");
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Options options;
    int rc = parse_options(argc, argv, options);
    if (rc >= 0) {
        return rc;
    }

    secern::utils::set_log_level(options.quiet ? secern::utils::LogLevel::kWarn
                                               : secern::utils::LogLevel::kInfo);
    if (!secern::utils::apply_log_level_from_env()) {
        secern::utils::log_warn("Ignoring unrecognised SECERN_LOG value");
    }

    // A closed reader must surface as EPIPE rather than end the process
    signal(SIGPIPE, SIG_IGN);
    std::ios::sync_with_stdio(false);

    log_info(std::string(PROGRAM_NAME) + " " + PROGRAM_VERSION);

    try {
        if (!options.template_file.empty()) {
            secern::config::generate_template(options.template_file);
            log_info("Wrote template configuration to " + options.template_file);
            return 0;
        }

        if (options.config_file.empty()) {
            log_error("Please specify the configuration file!");
            return 1;
        }

        return process(options);
    } catch (const secern::ConfigError& e) {
        report(e);
        return 1;
    } catch (const secern::Error& e) {
        log_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        log_error(std::string("Unexpected error: ") + e.what());
        return 1;
    }
}
