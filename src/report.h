//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "grade_core.h"

namespace gridscore {

constexpr std::string_view _text_log_name = "results_log.txt";
constexpr std::string_view _excel_log_name = "results.xlsx";

// Cell colours of the digits 0-9.
constexpr std::array<std::uint32_t, 10> _palette = {
        0x000000,  // black
        0x1e93ff,  // blue
        0xfa3e31,  // red
        0x4fcc30,  // green
        0xffdd00,  // yellow
        0x999999,  // grey
        0xe53ba3,  // pink
        0xff861c,  // orange
        0x88d8f1,  // light blue
        0x931131,  // maroon
};

// Spreadsheet fills from worst to best band.
constexpr std::array<std::uint32_t, 4> _band_colors = {0xff081b, 0xfe8015, 0xfdf709, 0x87e155};

// Index into `_band_colors` for `value`, empty if it is above `max_value`.
std::optional<std::size_t> color_band(double value, const std::array<double, 3> &thresholds,
                                      double max_value);

std::string render_text_log(const batch_result_t &batch, const grade_conf_t &conf, bool verbose);
void write_text_log(const fs::path &file, const batch_result_t &batch, const grade_conf_t &conf,
                    bool verbose);

// One row per task with its score and percent-correct, coloured by band.
void write_excel(const fs::path &file, const batch_result_t &batch, const grade_conf_t &conf);

std::string render_task_summary(int task_id, const task_result_t &result, const grade_conf_t &conf,
                                bool verbose);

std::vector<std::string> render_grid(const matrix_t &m);

// Prints input, expected output and (when `result` holds them) produced output of every example.
void print_task_examples(const task_t &task, const task_result_t *result);

}  // namespace gridscore
