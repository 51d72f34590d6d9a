#include "integrity.checker.hh"
#include "logger.hh"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <numeric>
#include <vector>

namespace {
void
print_usage(const char* program_name)
{
    std::cerr << "Usage: " << program_name
              << " <store_path> <number_of_iterations> [--strict-stale]\n"
              << "Example: " << program_name << " data.zarr 10\n";
}
} // namespace

int
main(int argc, char* argv[])
{
    if (argc != 3 && argc != 4) {
        print_usage(argv[0]);
        return 1;
    }

    long iters;

    {
        char* end;
        iters = std::strtol(argv[2], &end, 10);

        // Validate the input
        if (*end != '\0' || iters <= 0) {
            std::cerr << "Error: Please provide a valid positive number of "
                         "iterations\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    xzarrguard::CheckOptions options;
    options.timing = true;
    if (argc == 4) {
        if (std::strcmp(argv[3], "--strict-stale") != 0) {
            print_usage(argv[0]);
            return 1;
        }
        options.strict_stale = true;
    }

    Logger::set_log_level(LogLevel_Warning);

    // warm up the filesystem cache
    auto report = xzarrguard::check_store(argv[1], options);
    if (!report.errors.empty()) {
        std::cerr << "Error: " << report.errors.front() << "\n";
        return 1;
    }

    std::vector<double> seconds;
    for (auto i = 0; i < iters; ++i) {
        report = xzarrguard::check_store(argv[1], options);
        seconds.push_back(report.timing->total_seconds);
    }

    std::sort(seconds.begin(), seconds.end());
    const auto mean =
      std::accumulate(seconds.begin(), seconds.end(), 0.0) / seconds.size();
    const auto median =
      seconds.size() % 2 == 1
        ? seconds[seconds.size() / 2]
        : 0.5 * (seconds[seconds.size() / 2 - 1] + seconds[seconds.size() / 2]);

    const auto& timing = *report.timing;
    std::cout << "Store: " << report.store_path << "\n"
              << "Verdict: " << (report.ok ? "PASS" : "FAIL") << "\n"
              << "Variables: " << report.variables.size() << "\n"
              << "Existence checks per run: " << timing.exists_calls << "\n"
              << "Runs: " << iters << "\n"
              << "Min: " << seconds.front() << " s\n"
              << "Median: " << median << " s\n"
              << "Mean: " << mean << " s\n"
              << "Max: " << seconds.back() << " s\n"
              << "Last run: scan " << timing.scan_specs_seconds
              << " s, manifests " << timing.manifest_seconds
              << " s, chunks " << timing.chunk_scan_seconds << " s"
              << std::endl;

    return 0;
}
