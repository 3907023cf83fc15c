#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "grade_core.h"
#include "grader.h"
#include "gtest/gtest.h"
#include "solution_registry.h"

using gridscore::matrix_t;

namespace {

gridscore::task_t three_examples() {
    gridscore::task_t task;
    task.id = 1;
    task.examples = {{{{1}}, {{2}}}, {{{3, 3}}, {{4, 4}}}, {{{5}, {5}}, {{6}, {6}}}};
    task.group_sizes = {2, 1, 0};
    return task;
}

matrix_t add_one(const matrix_t &m) {
    matrix_t ret = m;
    for (auto &r : ret)
        for (auto &c : r) c++;
    return ret;
}

gridscore::resolved_t resolved(gridscore::candidate_fn fn, std::size_t size = 40) {
    const gridscore::grade_conf_t conf;
    return {std::move(fn), size, gridscore::tentative_score(size, conf)};
}

}  // namespace

TEST(tentativeScore, bounds) {
    const gridscore::grade_conf_t conf;
    EXPECT_EQ(gridscore::tentative_score(40, conf), 2460);
    EXPECT_EQ(gridscore::tentative_score(0, conf), 2500);
    EXPECT_EQ(gridscore::tentative_score(2499, conf), 1);
    EXPECT_EQ(gridscore::tentative_score(2500, conf), 1);
    EXPECT_EQ(gridscore::tentative_score(100000, conf), 1);
}

TEST(resolveCandidate, registry) {
    const gridscore::grade_conf_t conf;
    gridscore::MemoryRegistry reg;
    reg.add_sized(1, add_one, 500);
    reg.add_sized(2, gridscore::candidate_fn{}, 10);

    auto found = gridscore::resolve_candidate(reg, 1, conf);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->source_size, 500U);
    EXPECT_EQ(found->tentative_score, 2000);
    EXPECT_FALSE(gridscore::resolve_candidate(reg, 2, conf).has_value());
    EXPECT_FALSE(gridscore::resolve_candidate(reg, 3, conf).has_value());
    EXPECT_THROW(gridscore::resolve_candidate(reg, 0, conf), gridscore::GradeError);
    EXPECT_THROW(gridscore::resolve_candidate(reg, 401, conf), gridscore::GradeError);
}

TEST(gradeExample, outcomes) {
    const gridscore::example_t ex{{{1, 2}}, {{2, 3}}};
    EXPECT_EQ(gridscore::grade_example(add_one, ex).outcome, gridscore::outcome_t::_correct);
    auto wrong = gridscore::grade_example([](const matrix_t &m) { return m; }, ex);
    EXPECT_EQ(wrong.outcome, gridscore::outcome_t::_incorrect);
    EXPECT_EQ(wrong.produced, (matrix_t{{1, 2}}));
    EXPECT_TRUE(wrong.error.empty());
}
TEST(gradeExample, raggedIsIncorrect) {
    const gridscore::example_t ex{{{1}}, {{1, 1}, {1, 1}}};
    auto res = gridscore::grade_example([](const matrix_t &) { return matrix_t{{1, 1}, {1}}; },
                                        ex);
    EXPECT_EQ(res.outcome, gridscore::outcome_t::_incorrect);
}
TEST(gradeExample, crashText) {
    const gridscore::example_t ex{{{1}}, {{1, 1, 1}}};
    auto res = gridscore::grade_example(
            [](const matrix_t &) -> matrix_t { throw std::runtime_error("boom"); }, ex);
    EXPECT_EQ(res.outcome, gridscore::outcome_t::_crashed);
    EXPECT_EQ(res.error, "std::runtime_error('boom')");
    EXPECT_EQ(res.produced, (matrix_t{{0, 0, 0}}));
}
TEST(gradeExample, unknownException) {
    const gridscore::example_t ex{{{1}}, {{1}}};
    auto res = gridscore::grade_example([](const matrix_t &) -> matrix_t { throw 42; }, ex);
    EXPECT_EQ(res.outcome, gridscore::outcome_t::_crashed);
    EXPECT_EQ(res.error, "unknown exception");
}
TEST(gradeExample, outOfRange) {
    const gridscore::example_t ex{{{1}}, {{1}}};
    auto res = gridscore::grade_example([](const matrix_t &m) { return matrix_t{m.at(5)}; }, ex);
    EXPECT_EQ(res.outcome, gridscore::outcome_t::_crashed);
    EXPECT_EQ(res.error.rfind("std::out_of_range('", 0), 0U);
}

TEST(scoreTask, allCorrect) {
    const gridscore::grade_conf_t conf;
    auto res = gridscore::score_task(three_examples(), resolved(add_one), conf);
    EXPECT_EQ(res.score, 2460);
    EXPECT_EQ(res.percent_correct, 100);
    EXPECT_EQ(res.correct, (std::vector<int>{0, 1, 2}));
    EXPECT_TRUE(res.incorrect.empty());
    EXPECT_TRUE(res.crashed.empty());
    EXPECT_TRUE(res.produced.empty());
}
TEST(scoreTask, oneIncorrect) {
    const gridscore::grade_conf_t conf;
    auto fn = [](const matrix_t &m) {
        auto ret = add_one(m);
        if (ret.size() == 1 && ret[0].size() == 2) ret[0][0] = 0;
        return ret;
    };
    auto res = gridscore::score_task(three_examples(), resolved(fn), conf);
    EXPECT_DOUBLE_EQ(res.score, 0.001);
    EXPECT_DOUBLE_EQ(res.percent_correct, 66.67);
    EXPECT_EQ(res.correct, (std::vector<int>{0, 2}));
    EXPECT_EQ(res.incorrect, (std::vector<int>{1}));
    EXPECT_TRUE(res.crashed.empty());
}
TEST(scoreTask, oneCrashed) {
    const gridscore::grade_conf_t conf;
    auto fn = [](const matrix_t &m) {
        if (m.size() == 2) throw std::invalid_argument("two rows");
        return add_one(m);
    };
    auto res = gridscore::score_task(three_examples(), resolved(fn), conf, true);
    EXPECT_DOUBLE_EQ(res.score, 0.001);
    EXPECT_DOUBLE_EQ(res.percent_correct, 66.67);
    EXPECT_EQ(res.correct, (std::vector<int>{0, 1}));
    EXPECT_EQ(res.crashed, (std::vector<int>{2}));
    ASSERT_EQ(res.crash_errors.size(), 1U);
    EXPECT_EQ(res.crash_errors[0], "std::invalid_argument('two rows')");
    ASSERT_EQ(res.produced.size(), 3U);
    EXPECT_EQ(res.produced[2], (matrix_t{{0}, {0}}));
    EXPECT_EQ(res.total(), 3U);
}
TEST(scoreTask, notFound) {
    const gridscore::grade_conf_t conf;
    auto res = gridscore::score_task(three_examples(), std::nullopt, conf);
    EXPECT_DOUBLE_EQ(res.score, 0.001);
    EXPECT_EQ(res.percent_correct, 0);
    EXPECT_TRUE(res.correct.empty());
    EXPECT_TRUE(res.incorrect.empty());
    EXPECT_EQ(res.crashed.size(), 1U);
    EXPECT_EQ(res.crash_errors, (std::vector<std::string>{"function-not-found"}));
    EXPECT_TRUE(res.is_function_not_found(conf));
    EXPECT_EQ(gridscore::classify(res, conf), gridscore::partition_t::_crashed);
}
TEST(scoreTask, notFoundKeepsDummyOutputs) {
    const gridscore::grade_conf_t conf;
    auto res = gridscore::score_task(three_examples(), std::nullopt, conf, true);
    ASSERT_EQ(res.produced.size(), 3U);
    EXPECT_EQ(res.produced[1], (matrix_t{{0, 0}}));
}
TEST(scoreTask, idempotent) {
    const gridscore::grade_conf_t conf;
    const auto task = three_examples();
    auto fn = [](const matrix_t &m) {
        if (m.size() == 2) throw std::runtime_error("x");
        return m;
    };
    EXPECT_EQ(gridscore::score_task(task, resolved(fn), conf),
              gridscore::score_task(task, resolved(fn), conf));
}
TEST(scoreTask, partitionsExamples) {
    const gridscore::grade_conf_t conf;
    const auto task = three_examples();
    auto fn = [](const matrix_t &m) {
        if (m.size() == 2) throw std::runtime_error("x");
        if (m[0].size() == 2) return add_one(m);
        return m;
    };
    auto res = gridscore::score_task(task, resolved(fn), conf);
    EXPECT_EQ(res.correct, (std::vector<int>{1}));
    EXPECT_EQ(res.incorrect, (std::vector<int>{0}));
    EXPECT_EQ(res.crashed, (std::vector<int>{2}));
    EXPECT_EQ(res.crashed.size(), res.crash_errors.size());
    EXPECT_EQ(res.total(), task.examples.size());
    EXPECT_DOUBLE_EQ(res.percent_correct, 33.33);
}

TEST(scoreTask, percentTiesToEven) {
    const gridscore::grade_conf_t conf;
    for (auto [n, expected] : {std::pair{32, 3.12}, std::pair{160, 0.62}}) {
        gridscore::task_t task;
        task.examples.push_back({{{1}}, {{1}}});
        for (int i = 1; i < n; i++) task.examples.push_back({{{1}}, {{2}}});
        task.group_sizes = {static_cast<std::size_t>(n), 0, 0};
        auto res = gridscore::score_task(task, resolved([](const matrix_t &m) { return m; }),
                                         conf);
        EXPECT_EQ(res.correct.size(), 1U);
        EXPECT_DOUBLE_EQ(res.percent_correct, expected) << n << " examples";
    }
}

TEST(classify, partitions) {
    const gridscore::grade_conf_t conf;
    gridscore::task_result_t res;
    res.score = 2000;
    EXPECT_EQ(gridscore::classify(res, conf), gridscore::partition_t::_correct);
    res.score = conf.min_score;
    res.incorrect = {0};
    EXPECT_EQ(gridscore::classify(res, conf), gridscore::partition_t::_incorrect);
    res.crashed = {1};
    res.crash_errors = {"e"};
    EXPECT_EQ(gridscore::classify(res, conf), gridscore::partition_t::_crashed);
}
