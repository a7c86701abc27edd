/// @file src/data/data_loader.cpp
/// @brief CSV SignalLoader for per-class signal files.

#include "rfmc/data_loader.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace rfmc::data {

namespace {

/// Strip leading/trailing whitespace.
std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

// ─── SignalLoader::parse_row ──────────────────────────────────────────────────

std::optional<Signal> SignalLoader::parse_row(std::string_view line) noexcept {
    line = trim(line);
    // Skip blank lines and comment lines.
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    std::vector<double> fields;
    std::size_t start = 0;
    while (start <= line.size()) {
        const auto comma = line.find(',', start);
        const auto end   = (comma == std::string_view::npos) ? line.size() : comma;
        const std::string_view token = trim(line.substr(start, end - start));
        if (token.empty()) {
            return std::nullopt;  // empty token
        }

        double val = 0.0;
        const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), val);
        if (ec != std::errc{} || ptr != token.data() + token.size()) {
            return std::nullopt;  // unparsable or trailing garbage
        }
        if (!std::isfinite(val)) {
            return std::nullopt;
        }
        fields.push_back(val);

        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }

    if (fields.empty() || fields.size() % 2 != 0) {
        return std::nullopt;
    }

    const auto length = static_cast<Eigen::Index>(fields.size() / 2);
    Signal s(2, length);
    for (Eigen::Index t = 0; t < length; ++t) {
        s(0, t) = fields[static_cast<std::size_t>(t)];
        s(1, t) = fields[static_cast<std::size_t>(length + t)];
    }
    return s;
}

// ─── SignalLoader::parse_csv_string ───────────────────────────────────────────

ClassSource SignalLoader::parse_csv_string(std::string_view csv_content) noexcept {
    ClassSource signals;
    Eigen::Index length = -1;

    std::size_t start = 0;
    while (start < csv_content.size()) {
        auto end = csv_content.find('\n', start);
        if (end == std::string_view::npos) {
            end = csv_content.size();
        }
        auto signal = parse_row(csv_content.substr(start, end - start));
        start = end + 1;

        if (!signal) {
            continue;
        }
        if (length < 0) {
            length = signal->cols();
        }
        if (signal->cols() != length) {
            continue;  // width differs from the first valid row
        }
        signals.push_back(std::move(*signal));
    }

    return signals;
}

// ─── SignalLoader::load_csv ───────────────────────────────────────────────────

std::optional<ClassSource> SignalLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace rfmc::data
