//
// Copyright (c) 2024-2025 JLGxy
//

#include "settings.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#define FMT_ENFORCE_COMPILE_STRING 1

#include "fmt/core.h"
#include "grade_logs.h"

namespace gridscore {

namespace {

constexpr std::array<std::string_view, 7> _settings_keys = {
        "data_dir", "solution_dir",           "logs_dir",
        "jobs",     "visualize_single_task", "score_color_thresholds",
        "percent_color_thresholds"};

std::array<double, 3> read_thresholds(const YAML::Node &node, std::string_view key,
                                      std::string_view origin) {
    if (!node.IsSequence() || node.size() != 3) {
        throw ConfigError(origin,
                          fmt::format(GRIDSCORE_FMT("{} must be a list of 3 numbers"), key));
    }
    std::array<double, 3> ret{};
    for (std::size_t i = 0; i < 3; i++) ret[i] = node[i].as<double>();
    if (!std::is_sorted(ret.begin(), ret.end())) {
        throw ConfigError(origin, fmt::format(GRIDSCORE_FMT("{} must be ascending"), key));
    }
    return ret;
}

}  // namespace

settings_t parse_settings(const YAML::Node &node, std::string_view origin) {
    settings_t ret;
    if (!node || node.IsNull()) return ret;
    if (!node.IsMap()) throw ConfigError(origin, "top level must be a mapping");
    try {
        for (const auto &kv : node) {
            const auto key = kv.first.as<std::string>();
            if (std::ranges::find(_settings_keys, key) == _settings_keys.end()) {
                gl::print_warning(fmt::format(
                        GRIDSCORE_FMT("in config {}: unknown key `{}` ignored"), origin, key));
            }
        }
        if (node["data_dir"]) ret.data_dir = node["data_dir"].as<std::string>();
        if (node["solution_dir"]) ret.solution_dir = node["solution_dir"].as<std::string>();
        if (node["logs_dir"]) ret.logs_dir = node["logs_dir"].as<std::string>();
        if (node["visualize_single_task"]) {
            ret.visualize_single_task = node["visualize_single_task"].as<bool>();
        }
        if (node["jobs"]) {
            auto jobs = node["jobs"].as<int>();
            if (jobs < 1) throw ConfigError(origin, "jobs must be at least 1");
            ret.jobs = static_cast<std::size_t>(jobs);
        }
        if (node["score_color_thresholds"]) {
            ret.grade.score_thresholds = read_thresholds(node["score_color_thresholds"],
                                                         "score_color_thresholds", origin);
        }
        if (node["percent_color_thresholds"]) {
            ret.grade.percent_thresholds = read_thresholds(node["percent_color_thresholds"],
                                                           "percent_color_thresholds", origin);
        }
    } catch (YAML::Exception &e) {
        throw ConfigError(origin, e.what());
    }
    return ret;
}

settings_t load_settings(const fs::path &file) {
    if (!fs::exists(file)) return settings_t{};
    YAML::Node node;
    try {
        node = YAML::LoadFile(file.string());
    } catch (YAML::Exception &e) {
        throw ConfigError(file.string(), e.what());
    }
    return parse_settings(node, file.string());
}

}  // namespace gridscore
