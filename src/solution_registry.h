//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "grade_core.h"

namespace gridscore {

using candidate_fn = std::function<matrix_t(const matrix_t &)>;

struct candidate_t {
    candidate_fn fn;  // may be empty: registered, but nothing callable behind it
    std::size_t source_size;
};

// Where the candidate implementation of each task comes from.
class SolutionRegistry {
  public:
    SolutionRegistry() = default;
    SolutionRegistry(const SolutionRegistry &) = delete;
    SolutionRegistry &operator=(const SolutionRegistry &) = delete;
    virtual ~SolutionRegistry() = default;

    virtual bool is_registered(int task_id) const = 0;
    virtual std::optional<candidate_t> find(int task_id) const = 0;
};

class MemoryRegistry : public SolutionRegistry {
  public:
    // the size of `source` is what the candidate is scored on
    void add(int task_id, candidate_fn fn, std::string_view source);
    void add_sized(int task_id, candidate_fn fn, std::size_t source_size);

    bool is_registered(int task_id) const override;
    std::optional<candidate_t> find(int task_id) const override;

  private:
    std::map<int, candidate_t> solutions_;
};

// Solutions linked into the executable. Each src/solutions/taskNNN.cpp registers itself with
// GRIDSCORE_REGISTER_SOLUTION and is scored on the size of that file under `solution_dir`.
class CompiledRegistry : public SolutionRegistry {
  public:
    explicit CompiledRegistry(fs::path solution_dir);

    static bool add(int task_id, candidate_fn fn);
    static std::size_t count() { return table().size(); }

    fs::path source_file(int task_id) const;

    bool is_registered(int task_id) const override;
    // Throws GradeError if the task is registered but its source file is gone.
    std::optional<candidate_t> find(int task_id) const override;

  private:
    fs::path solution_dir_;

    static std::map<int, candidate_fn> &table();
};

}  // namespace gridscore

#define GRIDSCORE_CONCAT_IMPL(a, b) a##b
#define GRIDSCORE_CONCAT(a, b) GRIDSCORE_CONCAT_IMPL(a, b)

#define GRIDSCORE_REGISTER_SOLUTION(task_id, fn)                                      \
    [[maybe_unused]] static const bool GRIDSCORE_CONCAT(gridscore_registered_, __LINE__) = \
            ::gridscore::CompiledRegistry::add(task_id, fn)
