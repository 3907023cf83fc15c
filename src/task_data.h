//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <filesystem>

#include "grade_core.h"
#include "yaml-cpp/yaml.h"

namespace gridscore {

fs::path task_file(const fs::path &data_dir, int task_id);

// Reads `data_dir/taskNNN.json` and flattens its train, test and arc-gen groups in that order.
// Throws TaskDataError if the file is missing or malformed.
task_t load_task(const fs::path &data_dir, int task_id);

task_t parse_task(int task_id, const YAML::Node &node);

}  // namespace gridscore
