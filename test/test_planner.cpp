#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_utils.hpp"

using namespace Skuld;
using namespace Skuld::Testing;

namespace {
    Config::Settings tiny_settings()
    {
        Config::Settings settings{};
        settings.benchmark = Plan::Benchmark::DenseTransformer;
        settings.model = tiny_preset();
        settings.mesh = tiny_mesh();
        settings.network = small_network();
        settings.verbose = false;
        settings.fit.epochs = 3;
        settings.fit.batch_size = 4;
        settings.fit.min_examples = 4;
        settings.fit.validation_fraction = 0.0;
        settings.pipeline.timeout_ms = 0;
        settings.pipeline.backoff_ms = 0;
        settings.pipeline.max_training_plans = 16;
        settings.search.budget = 20;
        settings.search.workers = 2;
        settings.search.batch_size = 4;
        return settings;
    }

    std::shared_ptr<Store::ArtifactStore> memory_store()
    {
        return std::make_shared<Store::ArtifactStore>(std::make_shared<Store::MemoryBackend>());
    }
}

TEST(Planner, TrainsThenSearchesWithTheStoredPredictor)
{
    const auto measurer = std::make_shared<SyntheticMeasurer>();
    Planner planner(tiny_settings(), measurer, memory_store());
    EXPECT_EQ(planner.key().benchmark, "gpt");
    EXPECT_EQ(planner.spec().layers.size(), 4U);

    const auto plans = planner.training_plans();
    ASSERT_FALSE(plans.empty());
    EXPECT_LE(plans.size(), 16U);

    EXPECT_THROW(static_cast<void>(planner.predictor()), std::runtime_error);

    const auto outcome = planner.train_or_load(plans);
    ASSERT_TRUE(outcome.model);
    EXPECT_FALSE(outcome.loaded);
    EXPECT_EQ(outcome.measured, plans.size());
    EXPECT_EQ(measurer->calls(), plans.size());
    EXPECT_TRUE(planner.store().contains(planner.key()));
    EXPECT_EQ(planner.predictor().get(), outcome.model.get());

    const auto result = planner.search();
    ASSERT_TRUE(result.found());
    EXPECT_TRUE(Plan::is_feasible(*result.best_plan, planner.spec()));
    EXPECT_LE(result.evaluated, 20U);

    const auto queried = planner.query({*result.best_plan});
    ASSERT_EQ(queried.size(), 1U);
    EXPECT_NEAR(queried.front().predicted_latency, result.predicted_latency, 1e-6 * std::max(1.0, result.predicted_latency));
}

TEST(Planner, SecondPlannerReusesTheStoredPredictor)
{
    const auto store = memory_store();
    {
        Planner first(tiny_settings(), std::make_shared<SyntheticMeasurer>(), store);
        static_cast<void>(first.train_or_load());
    }

    const auto measurer = std::make_shared<SyntheticMeasurer>();
    Planner second(tiny_settings(), measurer, store);
    const auto outcome = second.train_or_load();
    EXPECT_TRUE(outcome.loaded);
    EXPECT_EQ(measurer->calls(), 0U);
}

TEST(Planner, SearchesWithACallerEstimatorAndPrintsTheRanking)
{
    Planner planner(tiny_settings(), nullptr, memory_store());
    const auto plans = eight_plans();
    std::map<std::string, double> table;
    for (std::size_t index = 0; index < plans.size(); ++index) {
        table[plans[index].signature()] = static_cast<double>(plans.size() - index);
    }
    const LookupEstimator estimator(table);

    const auto result = planner.search(Search::SearchSpace::from_plans(plans), estimator);
    ASSERT_TRUE(result.found());
    EXPECT_EQ(*result.best_plan, plans.back());

    // Quiet planners print nothing.
    planner.print_ranking(result);

    std::ostringstream table_output;
    planner.set_stream(&table_output);
    planner.print_ranking(result, 3);
    const auto text = table_output.str();
    EXPECT_NE(text.find("Rank"), std::string::npos);
    EXPECT_NE(text.find(plans.back().signature()), std::string::npos);
    EXPECT_EQ(text.find(plans.front().signature()), std::string::npos);
}

TEST(Planner, CancelledPlannerDoesNotTrain)
{
    Planner planner(tiny_settings(), std::make_shared<SyntheticMeasurer>(), memory_store());
    planner.cancel();
    const auto outcome = planner.train_or_load();
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_FALSE(outcome.model);
    EXPECT_FALSE(planner.store().contains(planner.key()));
}
