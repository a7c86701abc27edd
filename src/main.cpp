/// @file src/main.cpp
/// @brief RFMC CLI entry point.
///
/// Usage:
///   rfmc --synthetic [options]               Run on generated modulated signals
///   rfmc --run <class0.csv> <class1.csv> ... Run on one CSV file per class
///   rfmc --help                              Print usage

#include "rfmc/data_loader.hpp"
#include "rfmc/errors.hpp"
#include "rfmc/pipeline.hpp"
#include "rfmc/softmax_classifier.hpp"
#include "rfmc/synthetic.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  rfmc --synthetic [options]                 Generated BPSK/QPSK/16QAM data\n"
        "  rfmc --run <class0.csv> <class1.csv> ...   One CSV file per class\n"
        "  rfmc --help                                Show this help\n"
        "\n"
        "Options:\n"
        "  --bag geometric|arithmetic   Headline bagging method (default geometric)\n"
        "  --test-fraction F            Held-out fraction in (0, 1) (default 0.2)\n"
        "  --seed S                     Split seed (default 42)\n"
        "  --norm l1|l2|max             Row normalization (default l2)\n"
        "  --per-channel                Normalize I and Q separately\n"
        "  --length L                   Synthetic signal length (default 1024)\n"
        "  --per-class N                Synthetic signals per class (default 200)\n"
        "  --snr-db X                   Synthetic SNR in dB (default 10)\n"
        "  --verbose                    Progress on stderr\n"
        "\n"
        "CSV format (one signal per line, '#' lines ignored):\n"
        "  I0,...,I(L-1),Q0,...,Q(L-1)\n"
    );
}

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const char* first = text.data();
    const char* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

struct CliOptions {
    rfmc::core::PipelineConfig   pipeline;
    rfmc::data::SyntheticConfig  synthetic;
    std::vector<std::string>     files;
};

/// Parse everything after the mode argument.
/// Positional arguments are collected into `files`.
std::optional<CliOptions> parse_options(int argc, char* argv[], int start) {
    CliOptions opts;

    for (int i = start; i < argc; ++i) {
        const std::string_view arg(argv[i]);

        auto next = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", arg);
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };
        auto bad_value = [&](std::string_view value) {
            fmt::print(stderr, "Error: invalid value '{}' for {}\n", value, arg);
        };

        if (arg == "--verbose") {
            opts.pipeline.verbose = true;
        } else if (arg == "--per-channel") {
            opts.pipeline.normalizer.scope = rfmc::dsp::NormScope::Channel;
        } else if (arg == "--bag") {
            const auto value = next();
            if (!value) return std::nullopt;
            const auto method = rfmc::ensemble::parse_bag_method(*value);
            if (!method) { bad_value(*value); return std::nullopt; }
            opts.pipeline.bag_method = *method;
        } else if (arg == "--norm") {
            const auto value = next();
            if (!value) return std::nullopt;
            const auto kind = rfmc::dsp::parse_norm_kind(*value);
            if (!kind) { bad_value(*value); return std::nullopt; }
            opts.pipeline.normalizer.norm = *kind;
        } else if (arg == "--test-fraction") {
            const auto value = next();
            if (!value) return std::nullopt;
            const auto f = parse_number<double>(*value);
            if (!f) { bad_value(*value); return std::nullopt; }
            opts.pipeline.test_fraction = *f;
        } else if (arg == "--seed") {
            const auto value = next();
            if (!value) return std::nullopt;
            const auto s = parse_number<std::uint64_t>(*value);
            if (!s) { bad_value(*value); return std::nullopt; }
            opts.pipeline.seed = *s;
        } else if (arg == "--length") {
            const auto value = next();
            if (!value) return std::nullopt;
            const auto n = parse_number<std::size_t>(*value);
            if (!n) { bad_value(*value); return std::nullopt; }
            opts.synthetic.length = *n;
        } else if (arg == "--per-class") {
            const auto value = next();
            if (!value) return std::nullopt;
            const auto n = parse_number<std::size_t>(*value);
            if (!n) { bad_value(*value); return std::nullopt; }
            opts.synthetic.signals_per_class = *n;
        } else if (arg == "--snr-db") {
            const auto value = next();
            if (!value) return std::nullopt;
            const auto x = parse_number<double>(*value);
            if (!x) { bad_value(*value); return std::nullopt; }
            opts.synthetic.snr_db = *x;
        } else if (arg.starts_with("--")) {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        } else {
            opts.files.emplace_back(arg);
        }
    }
    return opts;
}

int run_pipeline(const std::vector<rfmc::data::ClassSource>& sources,
                 const rfmc::core::PipelineConfig& config) {
    auto classifiers =
        rfmc::core::ClassifierSet::make<rfmc::model::MomentSoftmaxClassifier>();
    const rfmc::core::Pipeline pipeline(config);
    const rfmc::core::PipelineReport report = pipeline.run(sources, classifiers);
    fmt::print("{}\n", report.to_string());
    return 0;
}

/// Generate synthetic classes and run the pipeline.
/// Returns 0 on success, 1 on error.
int run_synthetic(const CliOptions& opts) {
    if (!opts.files.empty()) {
        fmt::print(stderr, "Error: --synthetic takes no file arguments\n");
        return 1;
    }
    const auto sources = rfmc::data::SyntheticSource::generate(opts.synthetic);
    fmt::print("Generated {} classes × {} signals of length {} at {:.1f} dB SNR\n",
               sources.size(), opts.synthetic.signals_per_class,
               opts.synthetic.length, opts.synthetic.snr_db);
    return run_pipeline(sources, opts.pipeline);
}

/// Load one CSV file per class and run the pipeline.
/// Returns 0 on success, 1 on error.
int run_files(const CliOptions& opts) {
    if (opts.files.empty()) {
        fmt::print(stderr, "Error: --run requires at least one CSV file path\n");
        print_usage();
        return 1;
    }

    std::vector<rfmc::data::ClassSource> sources;
    sources.reserve(opts.files.size());
    for (const std::string& path : opts.files) {
        auto source = rfmc::data::SignalLoader::load_csv(path);
        if (!source) {
            fmt::print(stderr, "Error: cannot open file '{}'\n", path);
            return 1;
        }
        fmt::print("Loaded {} signals from '{}' (class {})\n",
                   source->size(), path, sources.size());
        sources.push_back(std::move(*source));
    }
    return run_pipeline(sources, opts.pipeline);
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--synthetic" && mode != "--run") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    const auto opts = parse_options(argc, argv, 2);
    if (!opts) {
        return 1;
    }

    try {
        return mode == "--synthetic" ? run_synthetic(*opts) : run_files(*opts);
    } catch (const rfmc::Error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
