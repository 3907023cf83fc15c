//
// Copyright (c) 2024-2025 JLGxy
//

#include "report.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#define FMT_ENFORCE_COMPILE_STRING 1

#include "fmt/color.h"
#include "fmt/core.h"
#include "fmt/ranges.h"
#include "grade_logs.h"
#include "xlsxwriter.h"  // IWYU pragma: keep

namespace gridscore {

std::optional<std::size_t> color_band(double value, const std::array<double, 3> &thresholds,
                                      double max_value) {
    for (std::size_t i = 0; i < thresholds.size(); i++) {
        if (value < thresholds[i]) return i;
    }
    if (value <= max_value) return thresholds.size();
    return std::nullopt;
}

std::string render_text_log(const batch_result_t &batch, const grade_conf_t &conf, bool verbose) {
    const auto n = conf.num_tasks;
    std::string log;
    auto out = std::back_inserter(log);

    fmt::format_to(out, GRIDSCORE_FMT("===================={}====================\n"),
                   "RESULTS SUMMARY");
    fmt::format_to(out, GRIDSCORE_FMT("Score: {}/{}\n"), round_to(batch.overall_score(), 3),
                   conf.max_overall_score());
    fmt::format_to(out, GRIDSCORE_FMT("Correctly solved: {}/{}\n"), batch.correct.size(), n);
    fmt::format_to(out, GRIDSCORE_FMT("Incorrectly Solved: {}/{}\n"), batch.incorrect.size(), n);
    fmt::format_to(out, GRIDSCORE_FMT("Program Crashed: {}/{}\n"), batch.crashed.size(), n);
    fmt::format_to(out, GRIDSCORE_FMT("Unattempted Tasks: {}/{}\n"), batch.unattempted.size(), n);
    log += "\n";

    fmt::format_to(out, GRIDSCORE_FMT("===================={}====================\n"),
                   "CORRECTLY SOLVED TASKS");
    for (auto id : batch.correct) {
        fmt::format_to(out, GRIDSCORE_FMT("{}: {}/{}\n\n"), task_name(id), batch.at(id).score,
                       conf.max_task_score);
    }

    fmt::format_to(out, GRIDSCORE_FMT("===================={}====================\n"),
                   "INCORRECTLY SOLVED TASKS");
    for (auto id : batch.incorrect) {
        const auto &res = batch.at(id);
        fmt::format_to(out, GRIDSCORE_FMT("{}:\n"), task_name(id));
        fmt::format_to(out, GRIDSCORE_FMT("\tCorrect Examples: {}\n"), res.correct);
        fmt::format_to(out, GRIDSCORE_FMT("\tIncorrect Examples: {}\n\n"), res.incorrect);
    }

    fmt::format_to(out, GRIDSCORE_FMT("===================={}====================\n"),
                   "CRASHED TASKS");
    for (auto id : batch.crashed) {
        const auto &res = batch.at(id);
        if (res.is_function_not_found(conf)) {
            fmt::format_to(out, GRIDSCORE_FMT("{}: NameError-Function \"{}\" not found.\n\n"),
                           task_name(id), conf.function_name);
            continue;
        }
        fmt::format_to(out, GRIDSCORE_FMT("{}:\n"), task_name(id));
        fmt::format_to(out, GRIDSCORE_FMT("\tCorrect Examples: {}\n"), res.correct);
        fmt::format_to(out, GRIDSCORE_FMT("\tIncorrect Examples: {}\n"), res.incorrect);
        if (verbose) {
            log += "\tCrashed Examples:\n";
            for (std::size_t j = 0; j < res.crashed.size(); j++) {
                fmt::format_to(out, GRIDSCORE_FMT("\t\t{}: {}\n"), res.crashed[j],
                               res.crash_errors[j]);
            }
        } else {
            fmt::format_to(out, GRIDSCORE_FMT("\tCrashed Examples: {}\n"), res.crashed);
        }
        log += "\n";
    }

    fmt::format_to(out, GRIDSCORE_FMT("===================={}====================\n"),
                   "UNATTEMPTED TASKS");
    for (auto id : batch.unattempted) {
        fmt::format_to(out, GRIDSCORE_FMT("{}\n"), task_name(id));
    }
    return log;
}

void write_text_log(const fs::path &file, const batch_result_t &batch, const grade_conf_t &conf,
                    bool verbose) {
    std::ofstream fout(file);
    if (!fout) {
        throw GradeError("can't create results log: " + file.string());
    }
    fout << render_text_log(batch, conf, verbose);
    if (!fout) {
        throw GradeError("failed to write results log: " + file.string());
    }
}

void write_excel(const fs::path &file, const batch_result_t &batch, const grade_conf_t &conf) {
    lxw_workbook *workbook = workbook_new(file.c_str());
    if (workbook == nullptr) {
        throw GradeError("can't create results sheet: " + file.string());
    }
    lxw_worksheet *worksheet = workbook_add_worksheet(workbook, "results");
    if (worksheet == nullptr) {
        workbook_close(workbook);
        throw GradeError("can't add worksheet to " + file.string());
    }

    std::array<lxw_format *, _band_colors.size()> fills{};
    for (std::size_t i = 0; i < fills.size(); i++) {
        fills[i] = workbook_add_format(workbook);
        format_set_bg_color(fills[i], _band_colors[i]);
    }
    auto fill_of = [&fills](double v, const std::array<double, 3> &thresholds,
                            double max_value) -> lxw_format * {
        auto band = color_band(v, thresholds, max_value);
        return band.has_value() ? fills[*band] : nullptr;
    };

    lxw_format *header = workbook_add_format(workbook);
    format_set_bold(header);
    worksheet_write_string(worksheet, 0, 1, "Score", header);
    worksheet_write_string(worksheet, 0, 2, "Percent Correct", header);

    for (int id = 1; id <= conf.num_tasks; id++) {
        const auto &res = batch.at(id);
        const auto row = static_cast<lxw_row_t>(id);
        worksheet_write_string(worksheet, row, 0, task_name(id).c_str(), header);
        worksheet_write_number(worksheet, row, 1, res.score,
                               fill_of(res.score, conf.score_thresholds, conf.max_task_score));
        worksheet_write_number(worksheet, row, 2, res.percent_correct,
                               fill_of(res.percent_correct, conf.percent_thresholds, 100));
    }

    worksheet_set_column(worksheet, 0, 0, 10, nullptr);
    worksheet_set_column(worksheet, 1, 2, 16, nullptr);

    lxw_error err = workbook_close(workbook);
    if (err != LXW_NO_ERROR) {
        throw GradeError("failed to write results sheet " + file.string() + ": " +
                         lxw_strerror(err));
    }
}

std::string render_task_summary(int task_id, const task_result_t &result, const grade_conf_t &conf,
                                bool verbose) {
    const auto total = result.total();
    auto title = task_name(task_id);
    std::transform(title.begin(), title.end(), title.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    std::string s;
    auto out = std::back_inserter(s);
    fmt::format_to(out,
                   GRIDSCORE_FMT("===================={} RESULTS SUMMARY====================\n"),
                   title);
    fmt::format_to(out, GRIDSCORE_FMT("Score: {}/{}\n\n"), result.score, conf.max_task_score);
    fmt::format_to(out, GRIDSCORE_FMT("Percent Correct: {}\n\n"), result.percent_correct);
    fmt::format_to(out, GRIDSCORE_FMT("Correctly solved: {}/{}\n"), result.correct.size(), total);
    fmt::format_to(out, GRIDSCORE_FMT("\t- {}\n\n"), result.correct);
    fmt::format_to(out, GRIDSCORE_FMT("Incorrectly solved: {}/{}\n"), result.incorrect.size(),
                   total);
    fmt::format_to(out, GRIDSCORE_FMT("\t- {}\n\n"), result.incorrect);
    fmt::format_to(out, GRIDSCORE_FMT("Crashed: {}/{}\n"), result.crashed.size(), total);
    if (verbose) {
        for (std::size_t i = 0; i < result.crashed.size(); i++) {
            fmt::format_to(out, GRIDSCORE_FMT("\t- {}: {}\n"), result.crashed[i],
                           result.crash_errors[i]);
        }
    } else {
        fmt::format_to(out, GRIDSCORE_FMT("\t- {}\n"), result.crashed);
    }
    return s;
}

std::vector<std::string> render_grid(const matrix_t &m) {
    std::vector<std::string> lines;
    lines.reserve(m.size());
    for (const auto &row : m) {
        std::string line;
        for (auto cell : row) {
            if (cell >= 0 && cell <= _max_color) {
                const auto bg = _palette[cell];
                const auto fg = cell == 0 || cell == 9 ? fmt::color::white : fmt::color::black;
                line += fmt::format(fmt::bg(fmt::rgb(bg)) | fmt::fg(fg), GRIDSCORE_FMT("{:>2}"),
                                    cell);
            } else {
                line += fmt::format(fmt::emphasis::reverse, GRIDSCORE_FMT("{:>2}"), '?');
            }
        }
        lines.emplace_back(std::move(line));
    }
    return lines;
}

namespace {

void print_grid(std::string_view title, const matrix_t &m) {
    gl::prog.println(GRIDSCORE_FMT("  {} ({}):"), title, shape_str(m));
    for (const auto &line : render_grid(m)) gl::prog.println(GRIDSCORE_FMT("    {}"), line);
}

}  // namespace

void print_task_examples(const task_t &task, const task_result_t *result) {
    std::size_t idx = 0;
    for (std::size_t g = 0; g < _example_groups.size(); g++) {
        for (std::size_t k = 0; k < task.group_sizes[g]; k++, idx++) {
            const auto &ex = task.examples[idx];
            std::string verdict;
            if (result != nullptr) {
                const auto i = static_cast<int>(idx);
                auto has = [i](const std::vector<int> &v) {
                    return std::find(v.begin(), v.end(), i) != v.end();
                };
                if (has(result->correct)) verdict = " - Correct";
                else if (has(result->incorrect)) verdict = " - Incorrect";
                else verdict = " - Crashed";
            }
            gl::prog.println(GRIDSCORE_FMT("example {} ({} #{}){}"), idx, _example_groups[g], k,
                             verdict);
            print_grid("input", ex.input);
            print_grid("expected output", ex.output);
            if (result != nullptr && idx < result->produced.size()) {
                print_grid("solution output", result->produced[idx]);
            }
        }
    }
}

}  // namespace gridscore
