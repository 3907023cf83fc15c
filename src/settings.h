//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstddef>
#include <filesystem>
#include <string_view>

#include "grade_core.h"
#include "yaml-cpp/yaml.h"

namespace gridscore {

struct settings_t {
    fs::path data_dir = "./data";
    fs::path solution_dir = "./src/solutions";
    fs::path logs_dir = "./logs";
    bool visualize_single_task = true;
    std::size_t jobs = 1;
    grade_conf_t grade;
};

constexpr std::string_view _default_settings_file = "gridscore.yaml";

// Defaults are kept for keys missing from `node`. Throws ConfigError on wrongly typed values.
settings_t parse_settings(const YAML::Node &node, std::string_view origin);

// A missing file yields the defaults.
settings_t load_settings(const fs::path &file);

}  // namespace gridscore
