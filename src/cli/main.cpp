#include "xzarrguard.h"
#include "integrity.checker.hh"
#include "manifest.hh"
#include "s3.connection.hh"
#include "store.creator.hh"

#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {
constexpr int exit_pass = 0;
constexpr int exit_fail = 1;
constexpr int exit_error = 2;

void
print_usage(const char* program_name)
{
    std::cerr
      << "Usage:\n"
      << "  " << program_name
      << " check <store> [--json] [--timing] [--strict-stale] [--threads N]\n"
      << "  " << program_name
      << " create <source> <target> [--no-data FILE] [--strategy NAME]"
         " [--overwrite]\n"
      << "  " << program_name << " --version\n"
      << "\n"
      << "Options:\n"
      << "  --log-level LEVEL  debug, info, warning, error or none\n"
      << "                     (default: $XZARRGUARD_LOG_LEVEL or warning)\n"
      << "  --strategy NAME    manifest or empty_chunks (default: manifest)\n"
      << "\n"
      << "Stores may be local paths or s3://<bucket>/<prefix> URLs; S3\n"
      << "endpoint and credentials are read from XZARRGUARD_S3_ENDPOINT,\n"
      << "XZARRGUARD_S3_ACCESS_KEY_ID and XZARRGUARD_S3_SECRET_ACCESS_KEY.\n";
}

std::optional<XzgLogLevel>
parse_log_level(std::string_view name)
{
    if (name == "debug") {
        return XzgLogLevel_Debug;
    }
    if (name == "info") {
        return XzgLogLevel_Info;
    }
    if (name == "warning") {
        return XzgLogLevel_Warning;
    }
    if (name == "error") {
        return XzgLogLevel_Error;
    }
    if (name == "none") {
        return XzgLogLevel_None;
    }
    return std::nullopt;
}

std::optional<std::string>
get_env(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<xzarrguard::S3Settings>
s3_settings_from_env()
{
    auto endpoint = get_env("XZARRGUARD_S3_ENDPOINT");
    auto access_key_id = get_env("XZARRGUARD_S3_ACCESS_KEY_ID");
    auto secret_access_key = get_env("XZARRGUARD_S3_SECRET_ACCESS_KEY");
    if (!endpoint || !access_key_id || !secret_access_key) {
        return std::nullopt;
    }

    return xzarrguard::S3Settings{
        .endpoint = *endpoint,
        .access_key_id = *access_key_id,
        .secret_access_key = *secret_access_key,
    };
}

struct Arguments
{
    std::vector<std::string> positional;
    bool json{ false };
    bool timing{ false };
    bool strict_stale{ false };
    bool overwrite{ false };
    unsigned int n_threads{ 0 };
    std::optional<std::string> no_data_path;
    std::string strategy{ "manifest" };
};

/// @return The parsed arguments, or nullopt after printing a diagnostic.
std::optional<Arguments>
parse_arguments(int argc, char* argv[], int first)
{
    Arguments args;
    for (auto i = first; i < argc; ++i) {
        const std::string_view arg(argv[i]);

        auto next_value = [&]() -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--json") {
            args.json = true;
        } else if (arg == "--timing") {
            args.timing = true;
        } else if (arg == "--strict-stale") {
            args.strict_stale = true;
        } else if (arg == "--overwrite") {
            args.overwrite = true;
        } else if (arg == "--threads") {
            const char* value = next_value();
            if (value == nullptr) {
                return std::nullopt;
            }

            char* end;
            const auto n = std::strtol(value, &end, 10);
            if (*end != '\0' || n <= 0) {
                std::cerr << "Error: Please provide a valid positive number of "
                             "threads\n";
                return std::nullopt;
            }
            args.n_threads = static_cast<unsigned int>(n);
        } else if (arg == "--no-data") {
            const char* value = next_value();
            if (value == nullptr) {
                return std::nullopt;
            }
            args.no_data_path = value;
        } else if (arg == "--strategy") {
            const char* value = next_value();
            if (value == nullptr) {
                return std::nullopt;
            }
            args.strategy = value;
        } else if (arg.starts_with("--")) {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return std::nullopt;
        } else {
            args.positional.emplace_back(arg);
        }
    }

    return args;
}

void
print_text_report(const xzarrguard::IntegrityReport& report, bool timing)
{
    std::cout << (report.ok ? "PASS" : "FAIL") << "\n";

    for (const auto& [name, variable] : report.variables) {
        std::vector<std::string> details;
        if (!variable.missing.empty()) {
            details.push_back("missing=" +
                              std::to_string(variable.missing.size()));
        }
        if (!variable.stale.empty()) {
            details.push_back("stale=" + std::to_string(variable.stale.size()));
        }
        if (variable.error) {
            details.push_back("error=" + *variable.error);
        }
        if (details.empty()) {
            continue;
        }

        std::cout << name << ":";
        for (auto i = 0; i < details.size(); ++i) {
            std::cout << (i == 0 ? " " : ", ") << details[i];
        }
        std::cout << "\n";
    }

    for (const auto& name : report.orphan_manifests) {
        std::cout << "warning: manifest without array: " << name << "\n";
    }

    for (const auto& error : report.errors) {
        std::cout << "error: " << error << "\n";
    }

    if (timing && report.timing) {
        const auto& t = *report.timing;
        std::cout << std::fixed << std::setprecision(3)
                  << "timing: total=" << t.total_seconds
                  << "s scan_specs=" << t.scan_specs_seconds
                  << "s manifest=" << t.manifest_seconds
                  << "s chunk_scan=" << t.chunk_scan_seconds
                  << "s exists_calls=" << t.exists_calls << "\n";
    }
}

int
run_check(const Arguments& args)
{
    if (args.positional.size() != 1) {
        std::cerr << "Error: check takes exactly one store\n";
        return exit_error;
    }

    xzarrguard::CheckOptions options;
    options.strict_stale = args.strict_stale;
    options.timing = args.timing;
    if (args.n_threads > 0) {
        options.n_threads = args.n_threads;
    }

    const auto s3_settings = s3_settings_from_env();

    xzarrguard::IntegrityReport report;
    try {
        report = xzarrguard::check_store(
          args.positional.front(),
          options,
          s3_settings ? &s3_settings.value() : nullptr);
    } catch (const std::exception& exc) {
        std::cerr << "error: " << exc.what() << "\n";
        return exit_error;
    }

    if (args.json) {
        std::cout << report.to_json().dump(2) << "\n";
    } else {
        print_text_report(report, args.timing);
    }

    return report.ok ? exit_pass : exit_fail;
}

int
run_create(const Arguments& args)
{
    if (args.positional.size() != 2) {
        std::cerr << "Error: create takes a source and a target store\n";
        return exit_error;
    }

    try {
        const auto strategy = xzarrguard::parse_no_data_strategy(args.strategy);

        xzarrguard::NoDataChunks no_data_chunks;
        if (args.no_data_path) {
            no_data_chunks =
              xzarrguard::load_no_data_chunks(*args.no_data_path);
        }

        const auto s3_settings = s3_settings_from_env();
        const auto source = xzarrguard::open_store(
          args.positional[0], s3_settings ? &s3_settings.value() : nullptr);
        const auto dataset = xzarrguard::read_dataset(*source);

        xzarrguard::CreateOptions options;
        options.overwrite = args.overwrite;
        if (args.n_threads > 0) {
            options.n_threads = args.n_threads;
        }

        const auto report = xzarrguard::create_store(
          dataset, args.positional[1], no_data_chunks, strategy, options);

        if (args.json) {
            std::cout << report.to_json().dump(2) << "\n";
        } else {
            std::cout << "created: " << report.store_path << "\n";
            if (!report.manifests_written.empty()) {
                std::cout << "manifests: " << report.manifests_written.size()
                          << "\n";
            }
        }
    } catch (const std::exception& exc) {
        std::cerr << "error: " << exc.what() << "\n";
        return exit_error;
    }

    return exit_pass;
}
} // namespace

int
main(int argc, char* argv[])
{
    auto log_level = XzgLogLevel_Warning;
    if (const auto level = get_env("XZARRGUARD_LOG_LEVEL"); level) {
        if (const auto parsed = parse_log_level(*level); parsed) {
            log_level = *parsed;
        } else {
            std::cerr << "Warning: ignoring XZARRGUARD_LOG_LEVEL=" << *level
                      << "\n";
        }
    }

    // global options precede the command
    int i = 1;
    for (; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--version") {
            std::cout << "xzarrguard " << Xzg_get_api_version() << "\n";
            return exit_pass;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return exit_pass;
        } else if (arg == "--log-level") {
            const auto level =
              i + 1 < argc ? parse_log_level(argv[i + 1]) : std::nullopt;
            if (!level) {
                std::cerr << "Error: --log-level requires one of debug, info, "
                             "warning, error, none\n";
                return exit_error;
            }
            log_level = *level;
            ++i;
        } else {
            break;
        }
    }

    if (i >= argc) {
        print_usage(argv[0]);
        return exit_error;
    }

    if (const auto status = Xzg_set_log_level(log_level);
        status != XzgStatusCode_Success) {
        std::cerr << "Error: " << Xzg_get_status_message(status) << "\n";
        return exit_error;
    }

    const std::string_view command(argv[i]);
    const auto args = parse_arguments(argc, argv, i + 1);
    if (!args) {
        print_usage(argv[0]);
        return exit_error;
    }

    if (command == "check") {
        return run_check(*args);
    }
    if (command == "create") {
        return run_create(*args);
    }

    std::cerr << "Error: Unknown command " << command << "\n";
    print_usage(argv[0]);
    return exit_error;
}
