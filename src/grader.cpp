//
// Copyright (c) 2024-2025 JLGxy
//

#include "grader.h"

#include <cxxabi.h>

#include <algorithm>
#include <boost/dynamic_bitset.hpp>
#include <cstdlib>
#include <exception>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <system_error>
#include <thread>
#include <typeinfo>
#include <utility>
#include <vector>

#define FMT_ENFORCE_COMPILE_STRING 1

#include "fmt/core.h"
#include "grade_logs.h"

namespace gridscore {

namespace {

// Joins every started worker on scope exit, also when starting a later one throws.
class WorkerGroup {
  public:
    WorkerGroup() = default;
    WorkerGroup(const WorkerGroup &) = delete;
    WorkerGroup &operator=(const WorkerGroup &) = delete;
    ~WorkerGroup() { join(); }

    template <typename F>
    void spawn(F &&f) {
        threads_.emplace_back(std::forward<F>(f));
    }
    std::size_t size() const { return threads_.size(); }
    void join() {
        for (auto &t : threads_) {
            if (t.joinable()) t.join();
        }
    }

  private:
    std::vector<std::thread> threads_;
};

std::string demangle(const char *name) {
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> res(
            abi::__cxa_demangle(name, nullptr, nullptr, &status), &std::free);
    return status == 0 && res ? std::string(res.get()) : std::string(name);
}

std::string describe(const std::exception &e) {
    return fmt::format(GRIDSCORE_FMT("{}('{}')"), demangle(typeid(e).name()), e.what());
}

}  // namespace

double tentative_score(std::size_t source_size, const grade_conf_t &conf) {
    const auto max_score = static_cast<std::size_t>(conf.max_task_score);
    if (source_size >= max_score) return 1;
    return static_cast<double>(std::max<std::size_t>(1, max_score - source_size));
}

std::optional<resolved_t> resolve_candidate(const SolutionRegistry &registry, int task_id,
                                            const grade_conf_t &conf) {
    if (task_id < 1 || task_id > conf.num_tasks) {
        throw GradeError(fmt::format(GRIDSCORE_FMT("task id {} violates the range [1, {}]"),
                                     task_id, conf.num_tasks));
    }
    auto found = registry.find(task_id);
    if (!found.has_value() || !found->fn) return std::nullopt;
    return resolved_t{std::move(found->fn), found->source_size,
                      tentative_score(found->source_size, conf)};
}

example_result_t grade_example(const candidate_fn &fn, const example_t &example) {
    example_result_t res{outcome_t::_crashed, "", {}};
    try {
        res.produced = fn(example.input);
        res.outcome = grids_equal(res.produced, example.output) ? outcome_t::_correct
                                                                : outcome_t::_incorrect;
        return res;
    } catch (const std::exception &e) {
        res.error = describe(e);
    } catch (...) {
        res.error = "unknown exception";
    }
    res.outcome = outcome_t::_crashed;
    res.produced = zero_like(example.output);
    return res;
}

task_result_t unattempted_result(const grade_conf_t &conf) {
    task_result_t ret;
    ret.score = conf.min_score;
    ret.percent_correct = 0;
    return ret;
}

task_result_t not_found_result(const task_t &task, const grade_conf_t &conf, bool store_results) {
    task_result_t ret = unattempted_result(conf);
    // one synthetic crash, so the task lands in the crashed partition
    ret.crashed = {1};
    ret.crash_errors = {conf.not_found_sentinel};
    if (store_results) {
        for (const auto &ex : task.examples) ret.produced.emplace_back(zero_like(ex.output));
    }
    return ret;
}

task_result_t score_task(const task_t &task, const std::optional<resolved_t> &candidate,
                         const grade_conf_t &conf, bool store_results) {
    if (!candidate.has_value()) return not_found_result(task, conf, store_results);

    task_result_t ret;
    const int n = static_cast<int>(task.examples.size());
    for (int i = 0; i < n; i++) {
        auto res = grade_example(candidate->fn, task.examples[i]);
        switch (res.outcome) {
            case outcome_t::_correct: ret.correct.emplace_back(i); break;
            case outcome_t::_incorrect: ret.incorrect.emplace_back(i); break;
            case outcome_t::_crashed:
                ret.crashed.emplace_back(i);
                ret.crash_errors.emplace_back(std::move(res.error));
                break;
        }
        if (store_results) ret.produced.emplace_back(std::move(res.produced));
    }

    ret.score = static_cast<int>(ret.correct.size()) == n ? candidate->tentative_score
                                                           : conf.min_score;
    ret.percent_correct = n == 0 ? 0
                                 : round_to(static_cast<double>(ret.correct.size()) /
                                                    static_cast<double>(n) * 100,
                                            2);
    return ret;
}

partition_t classify(const task_result_t &result, const grade_conf_t &conf) {
    if (result.score > conf.min_score) return partition_t::_correct;
    if (result.crashed.empty()) return partition_t::_incorrect;
    return partition_t::_crashed;
}

BatchGrader::BatchGrader(const grade_conf_t &conf, const SolutionRegistry &registry,
                         task_loader_t loader, std::size_t jobs)
        : conf_(conf),
          registry_(registry),
          loader_(std::move(loader)),
          jobs_(std::max<std::size_t>(jobs, 1)) {}

task_result_t BatchGrader::grade_one(int task_id) const {
    gl::prog.println(GRIDSCORE_FMT("grading -- {}"), task_name(task_id));
    const task_t task = loader_(task_id);
    return score_task(task, resolve_candidate(registry_, task_id, conf_), conf_);
}

batch_result_t BatchGrader::run() const {
    const auto n = static_cast<std::size_t>(conf_.num_tasks);
    boost::dynamic_bitset<> attempted(n);
    for (std::size_t i = 0; i < n; i++) {
        if (registry_.is_registered(static_cast<int>(i) + 1)) attempted.set(i);
    }

    batch_result_t batch;
    batch.results.resize(n);
    std::queue<int> pending;
    for (auto i = attempted.find_first(); i != boost::dynamic_bitset<>::npos;
         i = attempted.find_next(i)) {
        pending.push(static_cast<int>(i) + 1);
    }

    std::mutex lock;
    std::exception_ptr failure;
    auto record = [&](int task_id, task_result_t &&res) {
        const std::lock_guard guard(lock);
        batch.results[task_id - 1] = std::move(res);
        gl::prog.step();
    };

    {
        const gl::ProgressBarWrapper progressbar(pending.size());
        // never more workers than tasks
        const auto workers = std::min(jobs_, pending.size());
        if (workers <= 1) {
            for (; !pending.empty(); pending.pop()) {
                record(pending.front(), grade_one(pending.front()));
            }
        } else {
            auto worker = [&]() {
                while (true) {
                    int task_id;
                    {
                        const std::lock_guard guard(lock);
                        if (pending.empty() || failure) break;
                        task_id = pending.front();
                        pending.pop();
                    }
                    try {
                        record(task_id, grade_one(task_id));
                    } catch (...) {
                        const std::lock_guard guard(lock);
                        if (!failure) failure = std::current_exception();
                    }
                }
            };
            WorkerGroup group;
            for (std::size_t i = 0; i < workers; i++) {
                try {
                    group.spawn(worker);
                } catch (std::system_error &e) {
                    if (group.size() == 0) throw;
                    gl::print_warning(fmt::format(
                            GRIDSCORE_FMT("only {} of {} workers started: {}"), group.size(),
                            workers, e.what()));
                    break;
                }
            }
            group.join();
            if (failure) std::rethrow_exception(failure);
        }
    }

    for (std::size_t i = 0; i < n; i++) {
        const int task_id = static_cast<int>(i) + 1;
        if (!attempted.test(i)) {
            batch.results[i] = unattempted_result(conf_);
            batch.unattempted.emplace_back(task_id);
            continue;
        }
        switch (classify(batch.results[i], conf_)) {
            case partition_t::_correct: batch.correct.emplace_back(task_id); break;
            case partition_t::_incorrect: batch.incorrect.emplace_back(task_id); break;
            default: batch.crashed.emplace_back(task_id); break;
        }
    }
    return batch;
}

}  // namespace gridscore
