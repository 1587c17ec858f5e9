#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

#include "test_utils.hpp"

using namespace Skuld;
using namespace Skuld::Testing;

namespace {
    Store::ArtifactKey tiny_key()
    {
        return Store::make_key(Plan::Benchmark::DenseTransformer, tiny_mesh());
    }

    Pipeline::PipelineOptions quick_pipeline(Pipeline::ReuseMode reuse = Pipeline::ReuseMode::Train)
    {
        Pipeline::PipelineOptions options{};
        options.reuse = reuse;
        options.retry = Pipeline::RetryPolicy{
            .max_attempts = 3,
            .timeout = std::chrono::milliseconds(0),
            .backoff = std::chrono::milliseconds(0),
        };
        options.network = small_network();
        options.fit = quick_fit(3);
        options.stream = nullptr;
        return options;
    }

    std::shared_ptr<Store::ArtifactStore> memory_store()
    {
        return std::make_shared<Store::ArtifactStore>(std::make_shared<Store::MemoryBackend>());
    }

    class SlowMeasurer : public Pipeline::Measurer {
    public:
        Pipeline::MeasurementResult measure(const Plan::ExecutionPlan& plan) override
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            return Pipeline::MeasurementResult::success(synthetic_latency(plan));
        }
    };

    // Cancels the run from inside the first call, which then times out.
    class CancellingMeasurer : public SyntheticMeasurer {
    public:
        explicit CancellingMeasurer(Common::CancellationToken token) : token_(std::move(token)) {}

        Pipeline::MeasurementResult measure(const Plan::ExecutionPlan& plan) override
        {
            static_cast<void>(SyntheticMeasurer::measure(plan));
            token_.cancel();
            return Pipeline::MeasurementResult::failure(Pipeline::FailureReason::Timeout, "interrupted");
        }

    private:
        Common::CancellationToken token_;
    };

    // Reports the listed latencies verbatim and synthetic ones for every other plan.
    class RawLatencyMeasurer : public SyntheticMeasurer {
    public:
        explicit RawLatencyMeasurer(std::map<std::string, double> raw) : raw_(std::move(raw)) {}

        Pipeline::MeasurementResult measure(const Plan::ExecutionPlan& plan) override
        {
            const auto found = raw_.find(plan.signature());
            if (found == raw_.end()) {
                return SyntheticMeasurer::measure(plan);
            }
            ++raw_calls_;
            return Pipeline::MeasurementResult::success(found->second);
        }

        [[nodiscard]] std::size_t raw_calls() const noexcept { return raw_calls_.load(); }

    private:
        std::map<std::string, double> raw_;
        std::atomic<std::size_t> raw_calls_{0};
    };

    // In-memory storage that runs `before_first_lock` once, just before handing out the first key lock.
    class InterleavingBackend : public Store::StorageBackend {
    public:
        std::function<void()> before_first_lock{};

        [[nodiscard]] std::string describe(const std::string& path) const override { return inner_.describe(path); }
        [[nodiscard]] bool exists(const std::string& path) const override { return inner_.exists(path); }
        [[nodiscard]] std::optional<std::string> read(const std::string& path) const override { return inner_.read(path); }
        void write(const std::string& path, const std::string& bytes) override { inner_.write(path, bytes); }
        bool remove(const std::string& path) override { return inner_.remove(path); }
        [[nodiscard]] std::vector<std::string> list() const override { return inner_.list(); }

        [[nodiscard]] std::unique_ptr<Store::KeyLock> lock(const std::string& directory) override
        {
            if (auto hook = std::exchange(before_first_lock, nullptr)) {
                hook();
            }
            return inner_.lock(directory);
        }

    private:
        Store::MemoryBackend inner_{};
    };

    Pipeline::MeasurementCache stored_cache(Store::ArtifactStore& store, const Store::ArtifactKey& key)
    {
        const auto text = store.read_attachment(key, Pipeline::kMeasurementsFile);
        if (!text) {
            return {};
        }
        return Pipeline::MeasurementCache::from_property_tree(Common::SaveLoad::from_json_string(*text, "measurements"), "measurements");
    }
}

TEST(TrainingPipeline, MeasuresTrainsAndPersists)
{
    auto store = memory_store();
    auto measurer = std::make_shared<SyntheticMeasurer>();
    const auto plans = candidate_plans(16);
    const auto key = tiny_key();

    Pipeline::TrainingPipeline pipeline(store, measurer, quick_pipeline());
    const auto outcome = pipeline.train_or_load(key, plans, tiny_spec());

    EXPECT_FALSE(outcome.loaded);
    EXPECT_EQ(outcome.measured, plans.size());
    EXPECT_EQ(outcome.skipped, 0U);
    EXPECT_EQ(outcome.examples, plans.size());
    ASSERT_TRUE(outcome.model);
    EXPECT_EQ(outcome.model->freshness(), Model::Freshness::Trained);
    ASSERT_TRUE(outcome.report.has_value());
    EXPECT_EQ(outcome.report->epochs_completed, 3U);
    EXPECT_TRUE(store->contains(key));
    EXPECT_EQ(measurer->calls(), plans.size());
    EXPECT_EQ(pipeline.corpus(key).size(), plans.size());
}

TEST(TrainingPipeline, PretrainedModeReusesTheStoredPredictor)
{
    auto store = memory_store();
    auto measurer = std::make_shared<SyntheticMeasurer>();
    const auto plans = candidate_plans(12);
    const auto key = tiny_key();

    Pipeline::TrainingPipeline(store, measurer, quick_pipeline()).train_or_load(key, plans, tiny_spec());
    const auto calls = measurer->calls();

    Pipeline::TrainingPipeline reuse(store, measurer, quick_pipeline(Pipeline::ReuseMode::Pretrained));
    const auto outcome = reuse.train_or_load(key, plans, tiny_spec());
    EXPECT_TRUE(outcome.loaded);
    EXPECT_FALSE(outcome.report.has_value());
    EXPECT_EQ(measurer->calls(), calls);
    EXPECT_EQ(outcome.examples, plans.size());
}

TEST(TrainingPipeline, TrainModeRefusesAnExistingRecordWithoutOverwrite)
{
    auto store = memory_store();
    auto measurer = std::make_shared<SyntheticMeasurer>();
    const auto plans = candidate_plans(12);
    const auto key = tiny_key();
    Pipeline::TrainingPipeline(store, measurer, quick_pipeline()).train_or_load(key, plans, tiny_spec());

    Pipeline::TrainingPipeline again(store, measurer, quick_pipeline());
    EXPECT_THROW(static_cast<void>(again.train_or_load(key, plans, tiny_spec())), Error::DestinationConflict);

    auto options = quick_pipeline();
    options.overwrite = true;
    const auto calls = measurer->calls();
    Pipeline::TrainingPipeline overwrite(store, measurer, options);
    const auto outcome = overwrite.train_or_load(key, plans, tiny_spec());
    // The corpus already holds every plan, so nothing is measured again.
    EXPECT_EQ(outcome.measured, 0U);
    EXPECT_EQ(measurer->calls(), calls);
    EXPECT_EQ(outcome.examples, plans.size());
    EXPECT_TRUE(store->contains(key));
}

TEST(TrainingPipeline, FailedAndRejectedPlansAreSkippedAndRemembered)
{
    auto store = memory_store();
    const auto plans = candidate_plans(14);
    const auto key = tiny_key();
    auto measurer = std::make_shared<FailingMeasurer>(
        std::set<std::string>{plans[0].signature(), plans[1].signature()}, Pipeline::FailureReason::OutOfMemory,
        std::set<std::string>{plans[2].signature()});

    Pipeline::TrainingPipeline pipeline(store, measurer, quick_pipeline());
    const auto outcome = pipeline.train_or_load(key, plans, tiny_spec());
    EXPECT_EQ(outcome.skipped, 3U);
    EXPECT_EQ(outcome.measured, plans.size() - 3);
    // Out of memory is not transient: one attempt per failing plan.
    EXPECT_EQ(measurer->failures(), 2U);

    const auto cached = store->read_attachment(key, Pipeline::kMeasurementsFile);
    ASSERT_TRUE(cached.has_value());
    const auto cache = Pipeline::MeasurementCache::from_property_tree(
        Common::SaveLoad::from_json_string(*cached, "measurements"), "measurements");
    EXPECT_EQ(cache.excluded(), 3U);
    EXPECT_TRUE(cache.exclusion(plans[2].signature()) == Pipeline::FailureReason::Infeasible);

    auto options = quick_pipeline();
    options.overwrite = true;
    Pipeline::TrainingPipeline rerun(store, measurer, options);
    const auto second = rerun.train_or_load(key, plans, tiny_spec());
    EXPECT_EQ(second.skipped, 3U);
    EXPECT_EQ(measurer->failures(), 2U);
}

TEST(TrainingPipeline, RetriesTransientFailures)
{
    auto store = memory_store();
    auto measurer = std::make_shared<FlakyMeasurer>(1);
    const auto plans = candidate_plans(10);

    auto options = quick_pipeline();
    Pipeline::TrainingPipeline pipeline(store, measurer, options);
    const auto outcome = pipeline.train_or_load(tiny_key(), plans, tiny_spec());
    EXPECT_EQ(outcome.measured, plans.size());
    EXPECT_EQ(outcome.skipped, 0U);
    for (const auto& plan : plans) {
        EXPECT_EQ(measurer->attempts(plan.signature()), 2U);
    }
}

TEST(TrainingPipeline, TooFewExamplesRaiseInsufficientDataAndKeepTheCorpus)
{
    auto store = memory_store();
    auto measurer = std::make_shared<SyntheticMeasurer>();
    const auto plans = candidate_plans(3);
    const auto key = tiny_key();

    auto options = quick_pipeline();
    options.fit.min_examples = 10;
    Pipeline::TrainingPipeline pipeline(store, measurer, options);
    try {
        static_cast<void>(pipeline.train_or_load(key, plans, tiny_spec()));
        FAIL() << "expected InsufficientData";
    } catch (const Error::InsufficientData& error) {
        EXPECT_EQ(error.available(), 3U);
        EXPECT_EQ(error.minimum(), 10U);
    }
    EXPECT_FALSE(store->contains(key));
    EXPECT_EQ(pipeline.corpus(key).size(), 3U);
}

TEST(TrainingPipeline, CachedLatenciesStandInForTheMeasurer)
{
    auto store = memory_store();
    const auto plans = candidate_plans(12);
    const auto key = tiny_key();
    Pipeline::TrainingPipeline(store, std::make_shared<SyntheticMeasurer>(), quick_pipeline()).train_or_load(key, plans, tiny_spec());

    auto options = quick_pipeline();
    options.overwrite = true;
    options.warm_start = false;
    Pipeline::TrainingPipeline offline(store, nullptr, options);
    offline.reset_corpus(key);
    const auto outcome = offline.train_or_load(key, plans, tiny_spec());
    EXPECT_EQ(outcome.cached, plans.size());
    EXPECT_EQ(outcome.measured, 0U);
    EXPECT_EQ(outcome.model->freshness(), Model::Freshness::Trained);
}

TEST(TrainingPipeline, CheckpointsAtEpochBoundaries)
{
    auto store = memory_store();
    const auto key = tiny_key();
    auto options = quick_pipeline();
    options.checkpoint_interval = 1;
    bool stored_during_fit = false;
    options.fit.on_epoch = [&](const Model::EpochReport& report) {
        if (report.epoch == 2) {
            stored_during_fit = store->contains(key);
        }
    };

    Pipeline::TrainingPipeline pipeline(store, std::make_shared<SyntheticMeasurer>(), options);
    const auto outcome = pipeline.train_or_load(key, candidate_plans(12), tiny_spec());
    EXPECT_TRUE(stored_during_fit);
    EXPECT_TRUE(store->contains(key));
    EXPECT_EQ(store->load(key)->get(), outcome.model.get());
}

TEST(TrainingPipeline, CancellationLeavesTheStoreUntouched)
{
    auto store = memory_store();
    const auto key = tiny_key();
    auto options = quick_pipeline();
    options.cancellation.cancel();

    Pipeline::TrainingPipeline pipeline(store, std::make_shared<SyntheticMeasurer>(), options);
    const auto outcome = pipeline.train_or_load(key, candidate_plans(12), tiny_spec());
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_FALSE(outcome.model);
    EXPECT_FALSE(store->contains(key));
}

TEST(TrainingPipeline, CancellationBetweenRetriesExcludesNothing)
{
    auto store = memory_store();
    const auto key = tiny_key();
    const auto plans = candidate_plans(6);
    auto options = quick_pipeline();
    auto measurer = std::make_shared<CancellingMeasurer>(options.cancellation);

    Pipeline::TrainingPipeline pipeline(store, measurer, options);
    const auto outcome = pipeline.train_or_load(key, plans, tiny_spec());
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_FALSE(outcome.model);
    EXPECT_EQ(outcome.skipped, 0U);
    EXPECT_EQ(outcome.measured, 0U);
    EXPECT_EQ(measurer->calls(), 1U);

    const auto cache = stored_cache(*store, key);
    EXPECT_FALSE(cache.exclusion(plans[0].signature()).has_value());
    EXPECT_EQ(cache.excluded(), 0U);
    EXPECT_FALSE(store->contains(key));
}

TEST(TrainingPipeline, UnusableLatenciesAreExcludedInsteadOfTrainedOn)
{
    auto store = memory_store();
    const auto key = tiny_key();
    const auto plans = candidate_plans(14);
    auto measurer = std::make_shared<RawLatencyMeasurer>(std::map<std::string, double>{
        {plans[0].signature(), std::numeric_limits<double>::quiet_NaN()},
        {plans[1].signature(), -1.0},
        {plans[2].signature(), std::numeric_limits<double>::infinity()},
    });

    Pipeline::TrainingPipeline pipeline(store, measurer, quick_pipeline());
    const auto outcome = pipeline.train_or_load(key, plans, tiny_spec());
    EXPECT_EQ(outcome.skipped, 3U);
    EXPECT_EQ(outcome.measured, plans.size() - 3);
    ASSERT_TRUE(outcome.model);
    EXPECT_EQ(outcome.model->freshness(), Model::Freshness::Trained);
    EXPECT_EQ(pipeline.corpus(key).size(), plans.size() - 3);

    const auto cache = stored_cache(*store, key);
    for (std::size_t index = 0; index < 3; ++index) {
        EXPECT_TRUE(cache.exclusion(plans[index].signature()) == Pipeline::FailureReason::Error);
    }

    auto options = quick_pipeline();
    options.overwrite = true;
    Pipeline::TrainingPipeline rerun(store, measurer, options);
    const auto second = rerun.train_or_load(key, plans, tiny_spec());
    EXPECT_EQ(second.skipped, 3U);
    EXPECT_EQ(measurer->raw_calls(), 3U);
}

TEST(TrainingPipeline, PretrainedModeTakesARecordSavedWhileWaitingForTheLock)
{
    auto backend = std::make_shared<InterleavingBackend>();
    auto store = std::make_shared<Store::ArtifactStore>(backend);
    const auto key = tiny_key();
    const auto plans = candidate_plans(12);

    std::shared_ptr<const Model::PredictorModel> concurrent;
    backend->before_first_lock = [&] {
        concurrent = Pipeline::TrainingPipeline(store, std::make_shared<SyntheticMeasurer>(), quick_pipeline())
                         .train_or_load(key, plans, tiny_spec())
                         .model;
    };

    auto measurer = std::make_shared<SyntheticMeasurer>();
    Pipeline::TrainingPipeline late(store, measurer, quick_pipeline(Pipeline::ReuseMode::Pretrained));
    const auto outcome = late.train_or_load(key, plans, tiny_spec());
    ASSERT_TRUE(concurrent);
    EXPECT_TRUE(outcome.loaded);
    EXPECT_FALSE(outcome.report.has_value());
    EXPECT_EQ(outcome.model.get(), concurrent.get());
    EXPECT_EQ(store->load(key)->get(), concurrent.get());
    EXPECT_EQ(measurer->calls(), 0U);
}

TEST(Measurement, TimeoutAbandonsTheCall)
{
    auto measurer = std::make_shared<SlowMeasurer>();
    const auto result = Pipeline::measure_once(measurer, single_stage(4, 1, 1), std::chrono::milliseconds(20));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.reason, Pipeline::FailureReason::Timeout);
    EXPECT_THROW(static_cast<void>(result.value()), Error::MeasurementFailure);
    EXPECT_TRUE(Pipeline::is_transient(result.reason));
    EXPECT_EQ(Pipeline::parse_failure_reason("out_of_memory"), Pipeline::FailureReason::OutOfMemory);
}

TEST(Measurement, RetryStopsOnCancellationWithoutSpendingTheBudget)
{
    Common::CancellationToken token;
    auto measurer = std::make_shared<CancellingMeasurer>(token);
    const Pipeline::RetryPolicy policy{.max_attempts = 3, .timeout = std::chrono::milliseconds(0), .backoff = std::chrono::milliseconds(0)};
    const auto outcome = Pipeline::measure_with_retry(measurer, single_stage(4, 1, 1), policy, token);
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_EQ(outcome.attempts, 1U);
    EXPECT_FALSE(outcome.result.ok());
}

TEST(Measurement, OnlyFiniteNonNegativeLatenciesAreUsable)
{
    EXPECT_TRUE(Pipeline::is_valid_latency(0.0));
    EXPECT_TRUE(Pipeline::is_valid_latency(0.25));
    EXPECT_FALSE(Pipeline::is_valid_latency(-1.0));
    EXPECT_FALSE(Pipeline::is_valid_latency(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_FALSE(Pipeline::is_valid_latency(std::numeric_limits<double>::infinity()));

    Common::SaveLoad::PropertyTree entry;
    entry.put("signature", "broken");
    entry.put("latency_seconds", -2.0);
    Common::SaveLoad::PropertyTree measurements;
    measurements.push_back({"", entry});
    Common::SaveLoad::PropertyTree tree;
    tree.add_child("measurements", measurements);
    const auto cache = Pipeline::MeasurementCache::from_property_tree(tree, "measurements");
    EXPECT_FALSE(cache.latency("broken").has_value());
    EXPECT_TRUE(cache.exclusion("broken") == Pipeline::FailureReason::Error);
}

TEST(Sampling, FullProbabilityKeepsEveryInterval)
{
    const auto intervals = Pipeline::sample_stage_intervals(4, {.probability = 1.0, .reduce = 0, .exclude = {}, .seed = 0});
    EXPECT_EQ(intervals.size(), 10U);
    std::set<Pipeline::StageInterval> unique(intervals.begin(), intervals.end());
    EXPECT_EQ(unique.size(), 10U);
    EXPECT_TRUE(std::is_sorted(intervals.begin(), intervals.end()));
}

TEST(Sampling, PartialProbabilityHonoursExclusionsAndSeed)
{
    const Pipeline::IntervalSampling options{.probability = 0.5, .reduce = 1, .exclude = {0}, .seed = 11};
    const auto intervals = Pipeline::sample_stage_intervals(8, options);
    EXPECT_FALSE(intervals.empty());
    EXPECT_LE(intervals.size(), 18U);
    for (const auto& [first, last] : intervals) {
        EXPECT_NE(first, 0U);
        EXPECT_LE(first, last);
        EXPECT_LT(last, 8U);
        EXPECT_GE(last - first, 2U);
    }
    EXPECT_EQ(intervals, Pipeline::sample_stage_intervals(8, options));
}

TEST(Sampling, TrainingPlansAreFeasibleAndDistinct)
{
    const auto spec = tiny_spec();
    Pipeline::TrainingPlanOptions options{};
    options.max_plans = 12;
    options.seed = 3;
    const auto plans = Pipeline::generate_training_plans(spec, tiny_mesh(), options);
    EXPECT_FALSE(plans.empty());
    EXPECT_LE(plans.size(), 12U);

    std::unordered_set<std::string> signatures;
    for (const auto& plan : plans) {
        EXPECT_TRUE(Plan::is_feasible(plan, spec)) << plan.signature();
        EXPECT_TRUE(signatures.insert(plan.signature()).second);
    }
}
