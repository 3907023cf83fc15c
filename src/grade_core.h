//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "config.h"  // IWYU pragma: export

namespace gridscore {

namespace fs = std::filesystem;

using cell_t = int;
using row_t = std::vector<cell_t>;
// Rows of a grid. Candidates may hand back ragged rows, expected outputs are always rectangular.
using matrix_t = std::vector<row_t>;

constexpr cell_t _max_color = 9;

// The three example groups of a task file, in grading order.
constexpr std::array<std::string_view, 3> _example_groups = {"train", "test", "arc-gen"};

struct example_t {
    matrix_t input, output;
};

struct task_t {
    int id{};
    std::vector<example_t> examples;
    // number of examples contributed by each entry of `_example_groups`
    std::array<std::size_t, 3> group_sizes{};
};

enum class outcome_t : std::int8_t { _correct = 0, _incorrect = 1, _crashed = 2 };

std::string outcome_to_str(outcome_t out);

struct example_result_t {
    outcome_t outcome;
    std::string error;
    matrix_t produced;
};

// Scoring constants shared by the grader and the report writers.
struct grade_conf_t {
    int num_tasks = 400;
    int max_task_score = 2500;
    double min_score = 0.001;
    std::string function_name = "p";
    std::string not_found_sentinel = "function-not-found";
    // spreadsheet colour bands, see report.h
    std::array<double, 3> score_thresholds{625, 1250, 1875};
    std::array<double, 3> percent_thresholds{25, 50, 75};

    long max_overall_score() const { return static_cast<long>(num_tasks) * max_task_score; }
};

struct task_result_t {
    double score{};
    double percent_correct{};
    std::vector<int> correct, incorrect, crashed;
    std::vector<std::string> crash_errors;
    // outputs per example, kept only when the caller asks for them
    std::vector<matrix_t> produced;

    std::size_t total() const { return correct.size() + incorrect.size() + crashed.size(); }
    bool is_function_not_found(const grade_conf_t &conf) const {
        return !crash_errors.empty() && crash_errors.front() == conf.not_found_sentinel;
    }

    bool operator==(const task_result_t &) const = default;
};

enum class partition_t : std::int8_t { _correct, _incorrect, _crashed, _unattempted };

std::string partition_to_str(partition_t p);

struct batch_result_t {
    // indexed by task id - 1
    std::vector<task_result_t> results;
    std::vector<int> correct, incorrect, crashed, unattempted;

    const task_result_t &at(int task_id) const { return results.at(task_id - 1); }
    double overall_score() const;
    partition_t partition_of(int task_id) const;
};

bool is_rectangular(const matrix_t &m);
// Elementwise equality of two grids; a ragged grid is never equal to anything.
bool grids_equal(const matrix_t &produced, const matrix_t &expected);
matrix_t zero_like(const matrix_t &m);
std::string shape_str(const matrix_t &m);

std::string task_name(int task_id);

double round_to(double x, int digits);

class GradeError : public std::exception {
  public:
    explicit GradeError(const std::string_view what_arg)
            : what_str_(std::string("\033[31m\033[1merror:\033[0m ") + std::string(what_arg)) {}
    const char *what() const noexcept override { return what_str_.c_str(); }

  protected:
    std::string what_str_;
};

class TaskDataError : public GradeError {
  public:
    TaskDataError(const std::string_view name, const std::string_view what_arg)
            : GradeError(std::string("in task ") + std::string(name) + ":\n  " +
                         std::string(what_arg)) {}
};

class ConfigError : public GradeError {
  public:
    ConfigError(const std::string_view origin, const std::string_view what_arg)
            : GradeError(std::string("in config ") + std::string(origin) + ":\n  " +
                         std::string(what_arg)) {}
};

}  // namespace gridscore
