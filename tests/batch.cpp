#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "grade_core.h"
#include "grader.h"
#include "gtest/gtest.h"
#include "solution_registry.h"

using gridscore::matrix_t;

namespace {

gridscore::task_t one_example(int id) {
    gridscore::task_t task;
    task.id = id;
    task.examples = {{{{1, 2}}, {{2, 1}}}};
    task.group_sizes = {1, 0, 0};
    return task;
}

matrix_t flip(const matrix_t &m) {
    matrix_t ret = m;
    for (auto &r : ret) std::reverse(r.begin(), r.end());
    return ret;
}

// task 1 correct with 500 bytes, 2 incorrect, 3 crashed, the rest unattempted
void add_mixed(gridscore::MemoryRegistry &reg) {
    reg.add_sized(1, flip, 500);
    reg.add_sized(2, [](const matrix_t &m) { return m; }, 20);
    reg.add_sized(
            3, [](const matrix_t &) -> matrix_t { throw std::logic_error("bad"); }, 30);
}

}  // namespace

TEST(batchGrader, mixedRun) {
    const gridscore::grade_conf_t conf;
    gridscore::MemoryRegistry reg;
    add_mixed(reg);
    const gridscore::BatchGrader grader(conf, reg, one_example);
    const auto batch = grader.run();

    ASSERT_EQ(batch.results.size(), 400U);
    EXPECT_EQ(batch.correct, (std::vector<int>{1}));
    EXPECT_EQ(batch.incorrect, (std::vector<int>{2}));
    EXPECT_EQ(batch.crashed, (std::vector<int>{3}));
    EXPECT_EQ(batch.unattempted.size(), 397U);
    EXPECT_EQ(batch.unattempted.front(), 4);
    EXPECT_EQ(batch.unattempted.back(), 400);
    EXPECT_EQ(batch.at(1).score, 2000);
    EXPECT_NEAR(batch.overall_score(), 2000.399, 1e-9);
    EXPECT_DOUBLE_EQ(gridscore::round_to(batch.overall_score(), 3), 2000.399);

    EXPECT_EQ(batch.at(3).crash_errors, (std::vector<std::string>{"std::logic_error('bad')"}));
    EXPECT_DOUBLE_EQ(batch.at(2).percent_correct, 0);
    EXPECT_TRUE(batch.at(200).correct.empty());
    EXPECT_DOUBLE_EQ(batch.at(200).score, 0.001);
}

TEST(batchGrader, partitionsDisjointAndExhaustive) {
    const gridscore::grade_conf_t conf;
    gridscore::MemoryRegistry reg;
    add_mixed(reg);
    const auto batch = gridscore::BatchGrader(conf, reg, one_example).run();
    std::vector<int> seen(conf.num_tasks + 1, 0);
    for (const auto *part :
         {&batch.correct, &batch.incorrect, &batch.crashed, &batch.unattempted}) {
        EXPECT_TRUE(std::is_sorted(part->begin(), part->end()));
        for (auto id : *part) seen.at(id)++;
    }
    for (int id = 1; id <= conf.num_tasks; id++) EXPECT_EQ(seen[id], 1) << "task " << id;
    EXPECT_EQ(batch.partition_of(1), gridscore::partition_t::_correct);
    EXPECT_EQ(batch.partition_of(2), gridscore::partition_t::_incorrect);
    EXPECT_EQ(batch.partition_of(3), gridscore::partition_t::_crashed);
    EXPECT_EQ(batch.partition_of(4), gridscore::partition_t::_unattempted);
}

TEST(batchGrader, parallelMatchesSequential) {
    const gridscore::grade_conf_t conf;
    gridscore::MemoryRegistry reg;
    for (int id = 1; id <= 60; id++) {
        if (id % 3 == 0) {
            reg.add_sized(id, flip, static_cast<std::size_t>(id));
        } else if (id % 3 == 1) {
            reg.add_sized(id, [](const matrix_t &m) { return m; }, 1);
        } else {
            reg.add_sized(
                    id, [](const matrix_t &) -> matrix_t { throw std::runtime_error("x"); }, 1);
        }
    }
    const auto seq = gridscore::BatchGrader(conf, reg, one_example, 1).run();
    const auto par = gridscore::BatchGrader(conf, reg, one_example, 4).run();
    EXPECT_EQ(seq.results, par.results);
    EXPECT_EQ(seq.correct, par.correct);
    EXPECT_EQ(seq.incorrect, par.incorrect);
    EXPECT_EQ(seq.crashed, par.crashed);
    EXPECT_EQ(seq.unattempted, par.unattempted);
    EXPECT_EQ(seq.correct.size(), 20U);
    EXPECT_EQ(seq.unattempted.size(), 340U);
}

TEST(batchGrader, moreJobsThanTasks) {
    const gridscore::grade_conf_t conf;
    gridscore::MemoryRegistry reg;
    add_mixed(reg);
    const auto seq = gridscore::BatchGrader(conf, reg, one_example, 1).run();
    const auto par = gridscore::BatchGrader(conf, reg, one_example, 1000000).run();
    EXPECT_EQ(seq.results, par.results);
    EXPECT_EQ(par.correct, (std::vector<int>{1}));
    EXPECT_EQ(par.crashed, (std::vector<int>{3}));
}

TEST(batchGrader, nonCallableIsCrashed) {
    const gridscore::grade_conf_t conf;
    gridscore::MemoryRegistry reg;
    reg.add_sized(7, gridscore::candidate_fn{}, 10);
    const auto batch = gridscore::BatchGrader(conf, reg, one_example).run();
    EXPECT_EQ(batch.crashed, (std::vector<int>{7}));
    EXPECT_TRUE(batch.at(7).is_function_not_found(conf));
    EXPECT_EQ(batch.unattempted.size(), 399U);
}

TEST(batchGrader, emptyRegistry) {
    gridscore::grade_conf_t conf;
    conf.num_tasks = 10;
    const gridscore::MemoryRegistry reg;
    const auto batch = gridscore::BatchGrader(conf, reg, one_example).run();
    EXPECT_EQ(batch.unattempted.size(), 10U);
    EXPECT_NEAR(batch.overall_score(), 0.01, 1e-12);
}

TEST(batchGrader, loaderErrorPropagates) {
    const gridscore::grade_conf_t conf;
    gridscore::MemoryRegistry reg;
    add_mixed(reg);
    auto loader = [](int id) -> gridscore::task_t {
        if (id == 2) throw gridscore::TaskDataError(gridscore::task_name(id), "broken");
        return one_example(id);
    };
    EXPECT_THROW(gridscore::BatchGrader(conf, reg, loader, 1).run(), gridscore::TaskDataError);
    EXPECT_THROW(gridscore::BatchGrader(conf, reg, loader, 3).run(), gridscore::TaskDataError);
}
