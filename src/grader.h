//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstddef>
#include <functional>
#include <optional>

#include "grade_core.h"
#include "solution_registry.h"

namespace gridscore {

// A candidate that is ready to run, with the score it earns if every example passes.
struct resolved_t {
    candidate_fn fn;
    std::size_t source_size;
    double tentative_score;
};

double tentative_score(std::size_t source_size, const grade_conf_t &conf);

// Empty if the task has no registration or nothing callable behind it.
std::optional<resolved_t> resolve_candidate(const SolutionRegistry &registry, int task_id,
                                            const grade_conf_t &conf);

// Runs `fn` once on the example input. Anything the candidate throws ends up in the returned
// `error`; a crashed example gets a zero grid shaped like the expected output.
example_result_t grade_example(const candidate_fn &fn, const example_t &example);

task_result_t unattempted_result(const grade_conf_t &conf);
task_result_t not_found_result(const task_t &task, const grade_conf_t &conf, bool store_results);

task_result_t score_task(const task_t &task, const std::optional<resolved_t> &candidate,
                         const grade_conf_t &conf, bool store_results = false);

partition_t classify(const task_result_t &result, const grade_conf_t &conf);

using task_loader_t = std::function<task_t(int)>;

class BatchGrader {
  public:
    BatchGrader(const grade_conf_t &conf, const SolutionRegistry &registry, task_loader_t loader,
                std::size_t jobs = 1);

    // Grades every registered task in [1, num_tasks]; the others are recorded as unattempted.
    batch_result_t run() const;

  private:
    const grade_conf_t &conf_;
    const SolutionRegistry &registry_;
    task_loader_t loader_;
    std::size_t jobs_;

    task_result_t grade_one(int task_id) const;
};

}  // namespace gridscore
