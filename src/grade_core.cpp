//
// Copyright (c) 2024-2025 JLGxy
//

#include "grade_core.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

#define FMT_ENFORCE_COMPILE_STRING 1

#include "fmt/core.h"
#include "grade_logs.h"

namespace gridscore {

std::string outcome_to_str(outcome_t out) {
    switch (out) {
        case outcome_t::_correct: return "Correct";
        case outcome_t::_incorrect: return "Incorrect";
        case outcome_t::_crashed: return "Crashed";
        default: return "Undefined";
    }
}

std::string partition_to_str(partition_t p) {
    switch (p) {
        case partition_t::_correct: return "correct";
        case partition_t::_incorrect: return "incorrect";
        case partition_t::_crashed: return "crashed";
        case partition_t::_unattempted: return "unattempted";
        default: return "undefined";
    }
}

double batch_result_t::overall_score() const {
    return std::accumulate(results.begin(), results.end(), 0.0,
                           [](double s, const task_result_t &r) { return s + r.score; });
}

partition_t batch_result_t::partition_of(int task_id) const {
    auto in = [task_id](const std::vector<int> &v) {
        return std::binary_search(v.begin(), v.end(), task_id);
    };
    if (in(correct)) return partition_t::_correct;
    if (in(incorrect)) return partition_t::_incorrect;
    if (in(crashed)) return partition_t::_crashed;
    return partition_t::_unattempted;
}

bool is_rectangular(const matrix_t &m) {
    if (m.empty()) return true;
    const auto width = m.front().size();
    return std::all_of(m.begin(), m.end(), [width](const row_t &r) { return r.size() == width; });
}

bool grids_equal(const matrix_t &produced, const matrix_t &expected) {
    if (!is_rectangular(produced) || !is_rectangular(expected)) return false;
    return produced == expected;
}

matrix_t zero_like(const matrix_t &m) {
    matrix_t ret;
    ret.reserve(m.size());
    for (const auto &r : m) ret.emplace_back(r.size(), 0);
    return ret;
}

std::string shape_str(const matrix_t &m) {
    if (!is_rectangular(m)) return fmt::format(GRIDSCORE_FMT("{}x?"), m.size());
    return fmt::format(GRIDSCORE_FMT("{}x{}"), m.size(), m.empty() ? 0 : m.front().size());
}

std::string task_name(int task_id) { return fmt::format(GRIDSCORE_FMT("task{:03}"), task_id); }

double round_to(double x, int digits) {
    const double p = std::pow(10.0, digits);
    // ties go to even under the default rounding mode
    return std::nearbyint(x * p) / p;
}

}  // namespace gridscore
