/*
 * ctxformat C++ - Context File Checker
 *
 * Validates context files and optionally scans them for secrets.
 *
 * Usage:
 *   ./ctxformat-check [--config config.json] [--scan] file...
 *
 * Exit status: 0 all files valid (and clean with --scan), 1 a file is
 * invalid or unreadable, 2 secrets/PII found, 64 usage error.
 */
#include <ctxformat/core/config.hpp>
#include <ctxformat/core/logger.hpp>
#include <ctxformat/core/utils.hpp>
#include <ctxformat/format/parser.hpp>
#include <ctxformat/format/types.hpp>
#include <ctxformat/security/detector.hpp>
#include <ctxformat/security/secure_writer.hpp>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace ctxformat;

namespace {

const char* const kName = "ctxformat-check";
const char* const kVersion = "1.0.0";

const int kExitOk = 0;
const int kExitInvalid = 1;
const int kExitFindings = 2;
const int kExitUsage = 64;

struct Options {
    std::string config_file;
    bool scan;
    std::vector<std::string> files;

    Options() : scan(false) {}
};

void print_usage(const char* prog) {
    std::cout << kName << " - validate context files\n\n"
              << "Usage: " << prog << " [options] file...\n\n"
              << "Options:\n"
              << "  --config FILE  Load settings from a JSON config file\n"
              << "  --scan         Also scan file contents for secrets and PII\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n";
}

void print_version() {
    std::cout << kName << " v" << kVersion << " (format " << kFormatVersion << ")\n";
}

// Returns -1 to continue, otherwise the exit status
int parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return kExitOk;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return kExitOk;
        }
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a file argument\n";
                return kExitUsage;
            }
            opts.config_file = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--scan") == 0) {
            opts.scan = true;
            continue;
        }
        if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return kExitUsage;
        }
        opts.files.push_back(argv[i]);
    }

    if (opts.files.empty()) {
        print_usage(argv[0]);
        return kExitUsage;
    }
    return -1;
}

void setup_logging(const Config& config) {
    LogLevel level = LogLevel::WARN;
    std::string name = config.get_string("log_level", "warn");
    if (!parse_log_level(name, level)) {
        LOG_WARN("[Check] Unknown log_level '%s', using warn", name.c_str());
    }
    Logger::instance().set_level(level);
    Logger::instance().set_color(config.get_bool("log_color", isatty(STDERR_FILENO) != 0));
}

size_t line_of(const std::string& text, size_t offset) {
    size_t line = 1;
    for (size_t i = 0; i < offset && i < text.size(); ++i) {
        if (text[i] == '\n') ++line;
    }
    return line;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    int status = parse_args(argc, argv, opts);
    if (status >= 0) {
        return status;
    }

    Config config;
    if (!opts.config_file.empty() && !config.load_file(opts.config_file)) {
        std::cerr << "Cannot load config: " << config.last_error() << "\n";
        return kExitUsage;
    }
    setup_logging(config);

    DetectorOptions detector_opts;
    detector_opts.pii = WriterConfig::from_config(config).detect_pii;
    Detector detector(detector_opts);

    bool any_invalid = false;
    bool any_findings = false;

    for (const std::string& path : opts.files) {
        std::string text;
        std::string error;
        if (!read_file(path, text, error)) {
            std::cout << path << ": ERROR " << error << "\n";
            any_invalid = true;
            continue;
        }

        ValidationResult v = validate(text);
        if (!v.success) {
            std::cout << path << ": ERROR " << v.error << "\n";
            any_invalid = true;
            continue;
        }

        if (v.valid) {
            std::cout << path << ": OK\n";
        } else {
            std::cout << path << ": INVALID\n";
            for (const std::string& p : v.problems) {
                std::cout << "  " << p << "\n";
            }
            any_invalid = true;
        }

        if (!opts.scan) continue;

        std::vector<Detection> found = detector.detect(text);
        for (const Detection& d : found) {
            std::cout << "  line " << line_of(text, d.start) << ": "
                      << to_string(d.category) << " " << d.type << " " << d.masked << "\n";
        }
        if (!found.empty()) {
            LOG_INFO("[Check] %s: %zu finding(s)", path.c_str(), found.size());
            any_findings = true;
        }
    }

    if (any_invalid) return kExitInvalid;
    if (any_findings) return kExitFindings;
    return kExitOk;
}
