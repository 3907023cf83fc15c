//
// Copyright (c) 2024-2025 JLGxy
//

#include "solution_registry.h"

#include <system_error>
#include <utility>

namespace gridscore {

void MemoryRegistry::add(int task_id, candidate_fn fn, std::string_view source) {
    add_sized(task_id, std::move(fn), source.size());
}

void MemoryRegistry::add_sized(int task_id, candidate_fn fn, std::size_t source_size) {
    solutions_.insert_or_assign(task_id, candidate_t{std::move(fn), source_size});
}

bool MemoryRegistry::is_registered(int task_id) const { return solutions_.contains(task_id); }

std::optional<candidate_t> MemoryRegistry::find(int task_id) const {
    auto it = solutions_.find(task_id);
    if (it == solutions_.end()) return std::nullopt;
    return it->second;
}

CompiledRegistry::CompiledRegistry(fs::path solution_dir)
        : solution_dir_(std::move(solution_dir)) {}

std::map<int, candidate_fn> &CompiledRegistry::table() {
    static std::map<int, candidate_fn> solutions;
    return solutions;
}

bool CompiledRegistry::add(int task_id, candidate_fn fn) {
    return table().emplace(task_id, std::move(fn)).second;
}

fs::path CompiledRegistry::source_file(int task_id) const {
    return solution_dir_ / (task_name(task_id) + ".cpp");
}

bool CompiledRegistry::is_registered(int task_id) const { return table().contains(task_id); }

std::optional<candidate_t> CompiledRegistry::find(int task_id) const {
    auto it = table().find(task_id);
    if (it == table().end()) return std::nullopt;
    const auto file = source_file(task_id);
    std::error_code ec;
    auto size = fs::file_size(file, ec);
    if (ec) {
        throw GradeError("can't read solution source " + file.string() + ": " + ec.message());
    }
    return candidate_t{it->second, static_cast<std::size_t>(size)};
}

}  // namespace gridscore
