#include <benchmark/benchmark.h>

#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace {

bool has_flag(int argc, char** argv, const char* name) {
    const std::size_t len = std::strlen(name);
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && std::strncmp(argv[i], name, len) == 0) {
            return true;
        }
    }
    return false;
}

int flag_int(int argc, char** argv, const char* name, int fallback) {
    const std::string key(name);
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        if (arg.rfind(key, 0) != 0) {
            continue;
        }
        if (arg == key && i + 1 < argc) {
            return std::atoi(argv[i + 1]);
        }
        if (arg.size() > key.size() && arg[key.size()] == '=') {
            return std::atoi(arg.c_str() + key.size() + 1);
        }
    }
    return fallback;
}

}  // namespace

// Queue throughput numbers are noisy; with repeated runs only the aggregates are worth reading,
// and the per-benchmark counters line up better as a table.
int main(int argc, char** argv) {
    std::vector<std::string> extra;

    if (flag_int(argc, argv, "--benchmark_repetitions", 1) > 1 &&
        !has_flag(argc, argv, "--benchmark_report_aggregates_only")) {
        extra.emplace_back("--benchmark_report_aggregates_only=true");
    }
    if (!has_flag(argc, argv, "--benchmark_counters_tabular")) {
        extra.emplace_back("--benchmark_counters_tabular=true");
    }

    std::vector<char*> args(argv, argv + argc);
    for (auto& s : extra) {
        args.push_back(s.data());
    }

    int args_count = static_cast<int>(args.size());
    benchmark::Initialize(&args_count, args.data());
    if (benchmark::ReportUnrecognizedArguments(args_count, args.data())) {
        return 1;
    }
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
