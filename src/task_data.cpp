//
// Copyright (c) 2024-2025 JLGxy
//

#include "task_data.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#define FMT_ENFORCE_COMPILE_STRING 1

#include "fmt/core.h"
#include "grade_logs.h"

namespace gridscore {

namespace {

matrix_t read_matrix(const YAML::Node &node, const std::string_view what) {
    if (!node || !node.IsSequence()) {
        throw std::runtime_error(std::string(what) + " is not a list of rows");
    }
    matrix_t ret;
    ret.reserve(node.size());
    for (const auto &row_node : node) {
        if (!row_node.IsSequence()) {
            throw std::runtime_error(std::string(what) + " has a row that is not a list");
        }
        auto &row = ret.emplace_back();
        row.reserve(row_node.size());
        for (const auto &cell_node : row_node) {
            auto cell = cell_node.as<cell_t>();
            if (cell < 0 || cell > _max_color) {
                throw std::runtime_error(fmt::format(
                        GRIDSCORE_FMT("{} has a cell out of range [0, {}]: {}"), what, _max_color,
                        cell));
            }
            row.emplace_back(cell);
        }
    }
    if (!is_rectangular(ret)) {
        throw std::runtime_error(std::string(what) + " is not rectangular");
    }
    return ret;
}

}  // namespace

fs::path task_file(const fs::path &data_dir, int task_id) {
    return data_dir / (task_name(task_id) + ".json");
}

task_t parse_task(int task_id, const YAML::Node &node) {
    const auto name = task_name(task_id);
    task_t task;
    task.id = task_id;
    try {
        if (!node.IsMap()) throw std::runtime_error("task data is not an object");
        for (std::size_t g = 0; g < _example_groups.size(); g++) {
            const auto group = _example_groups[g];
            const auto &group_node = node[std::string(group)];
            if (!group_node || !group_node.IsSequence()) {
                throw std::runtime_error(fmt::format(GRIDSCORE_FMT("missing example group \"{}\""),
                                                     group));
            }
            std::size_t idx = 0;
            for (const auto &ex_node : group_node) {
                auto where = fmt::format(GRIDSCORE_FMT("{}[{}]"), group, idx++);
                auto &ex = task.examples.emplace_back();
                ex.input = read_matrix(ex_node["input"], where + ".input");
                ex.output = read_matrix(ex_node["output"], where + ".output");
            }
            task.group_sizes[g] = group_node.size();
        }
    } catch (YAML::Exception &e) {
        throw TaskDataError(name, e.what());
    } catch (std::runtime_error &e) {
        throw TaskDataError(name, e.what());
    }
    if (task.examples.empty()) {
        throw TaskDataError(name, "task has no examples");
    }
    return task;
}

task_t load_task(const fs::path &data_dir, int task_id) {
    const auto file = task_file(data_dir, task_id);
    if (!fs::is_regular_file(file)) {
        throw TaskDataError(task_name(task_id), "can't find task file: " + file.string());
    }
    YAML::Node node;
    try {
        node = YAML::LoadFile(file.string());
    } catch (YAML::Exception &e) {
        throw TaskDataError(task_name(task_id), e.what());
    }
    return parse_task(task_id, node);
}

}  // namespace gridscore
