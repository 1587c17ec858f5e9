#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hpp"

using namespace Skuld;
using namespace Skuld::Testing;

namespace {
    Search::SearchOptions quiet(std::size_t budget = 0, std::uint64_t seed = 0)
    {
        Search::SearchOptions options{};
        options.budget = budget;
        options.seed = seed;
        options.workers = 3;
        options.batch_size = 2;
        options.stream = nullptr;
        return options;
    }

    std::vector<std::string> signatures(const Search::SearchResult& result)
    {
        std::vector<std::string> out;
        for (const auto& entry : result.ranked) {
            out.push_back(entry.plan.signature());
        }
        return out;
    }

    // Counts predictions and cancels the search after the first batch.
    class CancellingEstimator : public Model::LatencyEstimator {
    public:
        explicit CancellingEstimator(Common::CancellationToken token) : token_(std::move(token)) {}

        [[nodiscard]] double predict(const Encoding::EncodedGraph&) const override
        {
            ++calls_;
            token_.cancel();
            return 1.0;
        }

        [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }

    private:
        mutable Common::CancellationToken token_;
        mutable std::atomic<std::size_t> calls_{0};
    };
}

TEST(PlanSearch, PicksTheLowestPredictedLatency)
{
    const auto plans = eight_plans();
    const std::vector<double> latencies{5, 3, 9, 3, 7, 2, 8, 4};
    std::map<std::string, double> table;
    for (std::size_t index = 0; index < plans.size(); ++index) {
        table[plans[index].signature()] = latencies[index];
    }
    const LookupEstimator estimator(table);

    const auto result = Search::PlanSearch(quiet()).search(tiny_spec(), Search::SearchSpace::from_plans(plans), estimator);
    ASSERT_TRUE(result.found());
    EXPECT_EQ(*result.best_plan, plans[5]);
    EXPECT_DOUBLE_EQ(result.predicted_latency, 2.0);
    EXPECT_EQ(result.status, Search::SearchStatus::Exhaustive);
    EXPECT_EQ(Search::to_string(result.status), "exhaustive");
    EXPECT_EQ(result.evaluated, 8U);
    EXPECT_EQ(result.skipped, 0U);

    ASSERT_EQ(result.ranked.size(), 8U);
    for (std::size_t index = 1; index < result.ranked.size(); ++index) {
        EXPECT_FALSE(Search::ranks_before(result.ranked[index], result.ranked[index - 1]));
    }
    // The two plans tied at 3 s are ordered by communication volume, then signature.
    const auto& tied_first = result.ranked[1];
    const auto& tied_second = result.ranked[2];
    EXPECT_DOUBLE_EQ(tied_first.predicted_latency, 3.0);
    EXPECT_DOUBLE_EQ(tied_second.predicted_latency, 3.0);
    const std::set<std::string> tied{tied_first.plan.signature(), tied_second.plan.signature()};
    EXPECT_EQ(tied, (std::set<std::string>{plans[1].signature(), plans[3].signature()}));
    EXPECT_LE(tied_first.communication_volume, tied_second.communication_volume);
    EXPECT_DOUBLE_EQ(tied_first.communication_volume, Graph::communication_volume(tied_first.plan, tiny_spec()));
}

TEST(PlanSearch, RepeatedSearchesAgree)
{
    const Model::PredictorModel model(small_network(), 5);
    const auto space = Search::SearchSpace::enumerate(tiny_spec(), tiny_mesh());
    ASSERT_FALSE(space.empty());

    const Search::PlanSearch search(quiet());
    const auto first = search.search(tiny_spec(), space, model);
    const auto second = search.search(tiny_spec(), space, model);
    EXPECT_EQ(signatures(first), signatures(second));
    EXPECT_EQ(first.best_plan, second.best_plan);
    EXPECT_EQ(first.evaluated, space.size());
}

TEST(PlanSearch, BudgetLimitsTheEvaluatedSubset)
{
    const LookupEstimator estimator(std::map<std::string, double>{});
    const auto space = Search::SearchSpace::enumerate(tiny_spec(), tiny_mesh());
    ASSERT_GT(space.size(), 5U);

    const auto first = Search::PlanSearch(quiet(5, 9)).search(tiny_spec(), space, estimator);
    EXPECT_EQ(first.status, Search::SearchStatus::BudgetLimited);
    EXPECT_EQ(Search::to_string(first.status), "best found, budget-limited");
    EXPECT_TRUE(first.budget_limited);
    EXPECT_EQ(first.evaluated, 5U);
    EXPECT_TRUE(first.found());

    const auto second = Search::PlanSearch(quiet(5, 9)).search(tiny_spec(), space, estimator);
    EXPECT_EQ(signatures(first), signatures(second));

    const auto unlimited = Search::PlanSearch(quiet(space.size(), 9)).search(tiny_spec(), space, estimator);
    EXPECT_EQ(unlimited.status, Search::SearchStatus::Exhaustive);
    EXPECT_FALSE(unlimited.budget_limited);
}

TEST(PlanSearch, InfeasibleCandidatesAreReportedAsSkipped)
{
    auto plans = eight_plans();
    const Plan::ExecutionPlan broken(tiny_mesh(),
                                     {Plan::StageAssignment{.first_layer = 0, .last_layer = 3, .degrees = {1, 3, 1},
                                                            .submesh = {1, 4}, .device_offset = 0}},
                                     1);
    plans.push_back(broken);

    const LookupEstimator estimator(std::map<std::string, double>{});
    const auto result = Search::PlanSearch(quiet()).search(tiny_spec(), Search::SearchSpace::from_plans(plans), estimator);
    EXPECT_EQ(result.evaluated, 8U);
    EXPECT_EQ(result.skipped, 1U);
    ASSERT_EQ(result.skipped_plans.size(), 1U);
    EXPECT_EQ(result.skipped_plans.front().signature, broken.signature());
    EXPECT_NE(result.skipped_plans.front().reason.find("Invalid plan"), std::string::npos);
}

TEST(PlanSearch, OversizedGraphsAreSkipped)
{
    auto options = quiet();
    options.encoder.max_nodes = 4;
    const LookupEstimator estimator(std::map<std::string, double>{});
    const auto result = Search::PlanSearch(options).search(tiny_spec(), Search::SearchSpace::from_plans(eight_plans()), estimator);
    EXPECT_FALSE(result.found());
    EXPECT_EQ(result.skipped, 8U);
}

TEST(PlanSearch, CancellationReturnsTheBestSoFar)
{
    auto options = quiet();
    options.workers = 1;
    const CancellingEstimator estimator(options.cancellation);
    const auto space = Search::SearchSpace::enumerate(tiny_spec(), tiny_mesh());
    ASSERT_GT(space.size(), options.batch_size);

    const auto result = Search::PlanSearch(options).search(tiny_spec(), space, estimator);
    EXPECT_EQ(result.status, Search::SearchStatus::Cancelled);
    EXPECT_EQ(result.evaluated, options.batch_size);
    EXPECT_TRUE(result.found());
    EXPECT_LT(result.evaluated, space.size());
    EXPECT_FALSE(result.budget_limited);
}

TEST(PlanSearch, CancellingABudgetLimitedSearchKeepsBothFacts)
{
    auto options = quiet(5, 9);
    options.workers = 1;
    std::ostringstream log;
    options.stream = &log;
    const CancellingEstimator estimator(options.cancellation);
    const auto space = Search::SearchSpace::enumerate(tiny_spec(), tiny_mesh());
    ASSERT_GT(space.size(), 5U);

    const auto result = Search::PlanSearch(options).search(tiny_spec(), space, estimator);
    EXPECT_EQ(result.status, Search::SearchStatus::Cancelled);
    EXPECT_TRUE(result.budget_limited);
    EXPECT_EQ(result.evaluated, options.batch_size);
    EXPECT_NE(log.str().find("cancelled, best so far, budget-limited"), std::string::npos);
}

TEST(PlanSearch, EmptySpaceFindsNothing)
{
    const LookupEstimator estimator(std::map<std::string, double>{});
    const auto result = Search::PlanSearch(quiet()).search(tiny_spec(), Search::SearchSpace{}, estimator);
    EXPECT_FALSE(result.found());
    EXPECT_EQ(result.evaluated, 0U);
}

TEST(SearchSpace, EnumeratesOnlyFeasibleDistinctPlans)
{
    const auto spec = tiny_spec();
    const auto space = Search::SearchSpace::enumerate(spec, tiny_mesh(), {.layer_groups = 2, .max_stages = 2, .max_micro_batches = 2});
    std::set<std::string> seen;
    for (const auto& plan : space.candidates()) {
        EXPECT_TRUE(Plan::is_feasible(plan, spec));
        EXPECT_TRUE(seen.insert(plan.signature()).second);
        EXPECT_LE(plan.stage_count(), 2U);
        EXPECT_LE(plan.micro_batches(), 2);
    }
    // One stage: 3 shapes x 2 micro batch counts.
    EXPECT_GE(space.size(), 6U);
}

TEST(PredictPlans, KeepsInputOrderAndRejectsInvalidPlans)
{
    const auto plans = eight_plans();
    std::map<std::string, double> table;
    for (std::size_t index = 0; index < plans.size(); ++index) {
        table[plans[index].signature()] = static_cast<double>(index);
    }
    const LookupEstimator estimator(table);
    const auto predictions = Search::predict_plans(tiny_spec(), plans, estimator);
    ASSERT_EQ(predictions.size(), plans.size());
    for (std::size_t index = 0; index < plans.size(); ++index) {
        EXPECT_EQ(predictions[index].plan, plans[index]);
        EXPECT_DOUBLE_EQ(predictions[index].predicted_latency, static_cast<double>(index));
    }

    EXPECT_THROW(static_cast<void>(Search::predict_plans(tiny_spec(), {single_stage(4, 1, 3)}, estimator)), Error::InvalidPlan);
}
