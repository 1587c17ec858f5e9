#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

#include <torch/torch.h>

#include "test_utils.hpp"

using namespace Skuld;
using namespace Skuld::Testing;

TEST(LatencyNormalizer, RoundTripsLatencies)
{
    Model::LatencyNormalizer normalizer;
    normalizer.fit({0.01, 0.02, 0.5, 1.5});
    for (const auto seconds : {0.0, 0.01, 0.3, 2.0}) {
        EXPECT_NEAR(normalizer.denormalize(normalizer.normalize(seconds)), seconds, 1e-9);
    }
    EXPECT_THROW(static_cast<void>(normalizer.normalize(-1.0)), std::invalid_argument);

    const auto restored = Model::LatencyNormalizer::from_property_tree(normalizer.to_property_tree(), "normalizer");
    EXPECT_NEAR(restored.normalize(0.3), normalizer.normalize(0.3), 1e-12);
}

TEST(PredictorModel, UntrainedPredictionsAreFiniteAndNonNegative)
{
    const Model::PredictorModel model(small_network());
    EXPECT_EQ(model.freshness(), Model::Freshness::Untrained);

    std::vector<Encoding::EncodedGraph> encoded;
    for (const auto& plan : eight_plans()) {
        encoded.push_back(encode(plan));
    }
    std::vector<const Encoding::EncodedGraph*> pointers;
    for (const auto& graph : encoded) {
        pointers.push_back(&graph);
    }

    const auto batch = model.predict_batch(pointers);
    ASSERT_EQ(batch.size(), encoded.size());
    for (std::size_t index = 0; index < encoded.size(); ++index) {
        const auto single = model.predict(encoded[index]);
        EXPECT_TRUE(std::isfinite(single));
        EXPECT_GE(single, 0.0);
        EXPECT_NEAR(batch[index], single, 1e-6 * std::max(1.0, single));
    }
}

TEST(PredictorModel, SameSeedGivesSamePredictions)
{
    const Model::PredictorModel first(small_network(), 7);
    const Model::PredictorModel second(small_network(), 7);
    const auto graph = encode(two_stage(2, 1, 1));
    EXPECT_DOUBLE_EQ(first.predict(graph), second.predict(graph));
}

TEST(PredictorModel, RejectsEncodingsOfAnotherSchema)
{
    const Model::PredictorModel model(small_network());
    auto graph = encode(single_stage(4, 1, 1));
    graph.schema_version = "v1";
    EXPECT_THROW(static_cast<void>(model.predict(graph)), Error::SchemaMismatch);
}

TEST(PredictorModel, FitReducesTheTrainingLoss)
{
    Model::PredictorModel model(small_network());
    const auto examples = training_examples(candidate_plans(24));
    ASSERT_GE(examples.size(), 12U);

    std::vector<double> losses;
    auto options = quick_fit(30);
    options.restore_best_state = false;
    options.on_epoch = [&losses](const Model::EpochReport& report) { losses.push_back(report.train_loss); };

    const auto report = model.fit(examples, options);
    ASSERT_EQ(report.epochs_completed, 30U);
    ASSERT_EQ(losses.size(), 30U);
    EXPECT_LT(losses.back(), losses.front());
    EXPECT_EQ(model.freshness(), Model::Freshness::Trained);
    EXPECT_EQ(model.example_count(), examples.size());
    EXPECT_FALSE(model.created_at().empty());

    for (const auto& example : examples) {
        const auto predicted = model.predict(example.encoded);
        EXPECT_TRUE(std::isfinite(predicted));
        EXPECT_GE(predicted, 0.0);
    }
}

TEST(PredictorModel, LogsEpochsAndRestoresTheBestState)
{
    Model::PredictorModel model(small_network());
    const auto examples = training_examples(candidate_plans(16));

    std::ostringstream log;
    auto options = quick_fit(4);
    options.validation_fraction = 0.25;
    options.monitor = true;
    options.stream = &log;
    options.loss = Loss::RelativeError();
    options.scheduler = LrScheduler::CosineAnnealing({.T_max = 0, .eta_min = 1e-5, .warmup_steps = 2, .warmup_start_factor = 0.1});

    const auto report = model.fit(examples, options);
    EXPECT_EQ(report.validation_examples, 4U);
    EXPECT_TRUE(report.best_validation_loss.has_value());
    EXPECT_TRUE(report.restored_best_state);
    EXPECT_NE(log.str().find("Epoch [4/4]"), std::string::npos);
    EXPECT_NE(log.str().find("Reloading best state"), std::string::npos);
}

TEST(PredictorModel, TooFewExamplesRaiseInsufficientData)
{
    Model::PredictorModel model(small_network());
    const auto examples = training_examples(candidate_plans(3));
    auto options = quick_fit();
    options.min_examples = 10;
    try {
        static_cast<void>(model.fit(examples, options));
        FAIL() << "expected InsufficientData";
    } catch (const Error::InsufficientData& error) {
        EXPECT_EQ(error.available(), 3U);
        EXPECT_EQ(error.minimum(), 10U);
    }
    EXPECT_EQ(model.freshness(), Model::Freshness::Untrained);
}

TEST(PredictorModel, CancellationStopsAtAnEpochBoundary)
{
    Model::PredictorModel model(small_network());
    const auto examples = training_examples(candidate_plans(12));
    auto options = quick_fit(50);
    options.on_epoch = [&options](const Model::EpochReport& report) {
        if (report.epoch == 2) {
            options.cancellation.cancel();
        }
    };

    const auto report = model.fit(examples, options);
    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.epochs_completed, 2U);
}

TEST(PredictorModel, RestoresFromMetadataAndParameters)
{
    Model::PredictorModel model(small_network());
    const auto examples = training_examples(candidate_plans(12));
    static_cast<void>(model.fit(examples, quick_fit(3)));

    const auto restored = Model::PredictorModel::restore(model.metadata(), model.serialize_parameters(), "in-memory model");
    EXPECT_EQ(restored->freshness(), Model::Freshness::Loaded);
    EXPECT_EQ(restored->options(), model.options());
    EXPECT_EQ(restored->example_count(), model.example_count());
    for (const auto& example : examples) {
        const auto expected = model.predict(example.encoded);
        EXPECT_NEAR(restored->predict(example.encoded), expected, 1e-9 * std::max(1.0, expected));
    }

    auto metadata = model.metadata();
    metadata.put("schema_version", "v1");
    EXPECT_THROW(static_cast<void>(Model::PredictorModel::restore(metadata, model.serialize_parameters(), "old model")),
                 Error::SchemaMismatch);
    EXPECT_THROW(static_cast<void>(Model::PredictorModel::restore(model.metadata(), "not an archive", "broken model")),
                 Error::ArtifactCorrupted);
}

TEST(PredictorModel, WarmStartContinuesFromTheRestoredState)
{
    Model::PredictorModel model(small_network());
    const auto examples = training_examples(candidate_plans(12));
    static_cast<void>(model.fit(examples, quick_fit(3)));

    // Ten times slower latencies would move a freshly fitted normalizer far away.
    auto slower = examples;
    for (auto& example : slower) {
        example.latency_seconds *= 10.0;
    }
    auto options = quick_fit(1);
    options.optimizer = Optimizer::SGD({.learning_rate = 1e-9, .momentum = 0.0, .weight_decay = 0.0, .nesterov = false});

    const auto warm = Model::PredictorModel::restore(model.metadata(), model.serialize_parameters(), "warm model");
    options.warm_start = true;
    const auto report = warm->fit(slower, options);
    EXPECT_EQ(report.epochs_completed, 1U);
    EXPECT_DOUBLE_EQ(warm->normalizer().mean(), model.normalizer().mean());
    EXPECT_DOUBLE_EQ(warm->normalizer().stddev(), model.normalizer().stddev());
    for (const auto& example : examples) {
        const auto expected = model.predict(example.encoded);
        EXPECT_NEAR(warm->predict(example.encoded), expected, 1e-4 * std::max(1.0, expected));
    }

    const auto cold = Model::PredictorModel::restore(model.metadata(), model.serialize_parameters(), "cold model");
    options.warm_start = false;
    static_cast<void>(cold->fit(slower, options));
    EXPECT_GT(std::abs(cold->normalizer().mean() - model.normalizer().mean()), 1.0);
}

TEST(TrainingComponents, PointwiseLossesOnNormalizedTargets)
{
    const auto prediction = torch::tensor({0.0, 1.0, 4.0}, torch::kFloat64);
    const auto target = torch::tensor({0.0, 0.5, 1.0}, torch::kFloat64);

    EXPECT_NEAR(Loss::compute(Loss::MSE(), prediction, target).item<double>(), (0.25 + 9.0) / 3.0, 1e-12);
    EXPECT_NEAR(Loss::compute(Loss::MAE({.reduction = Loss::Reduction::Sum}), prediction, target).item<double>(), 3.5, 1e-12);
    // 0.5 * 0.5^2 below beta, 3 - 0.5 above.
    EXPECT_NEAR(Loss::compute(Loss::SmoothL1(), prediction, target).item<double>(), (0.125 + 2.5) / 3.0, 1e-12);
    EXPECT_EQ(Loss::compute(Loss::MSE({.reduction = Loss::Reduction::None}), prediction, target).size(0), 3);

    const auto relative = Loss::compute(Loss::RelativeError(), torch::tensor({2.0}, torch::kFloat64), torch::tensor({4.0}, torch::kFloat64));
    EXPECT_NEAR(relative.item<double>(), 0.5, 1e-12);

    for (const auto* name : {"mse", "mae", "smooth_l1", "relative"}) {
        EXPECT_EQ(Loss::name_of(Loss::parse_descriptor(name)), name);
    }
    EXPECT_THROW(static_cast<void>(Loss::parse_descriptor("hinge")), std::invalid_argument);
}

TEST(TrainingComponents, OptimizerDescriptorsByName)
{
    for (const auto* name : {"adamw", "adam", "sgd"}) {
        const auto descriptor = Optimizer::parse_descriptor(name, 2e-3);
        EXPECT_EQ(Optimizer::name_of(descriptor), name);
        EXPECT_DOUBLE_EQ(Optimizer::learning_rate(descriptor), 2e-3);

        auto weight = torch::zeros({2}, torch::requires_grad());
        const auto optimizer = Optimizer::build({weight}, descriptor);
        EXPECT_DOUBLE_EQ(optimizer->param_groups().front().options().get_lr(), 2e-3);
    }
    EXPECT_THROW(static_cast<void>(Optimizer::parse_descriptor("lbfgs", 1e-3)), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(Optimizer::parse_descriptor("adamw", 0.0)), std::invalid_argument);
}

TEST(TrainingComponents, CosineScheduleWarmsUpThenAnneals)
{
    const LrScheduler::CosineAnnealingOptions options{.T_max = 10, .eta_min = 0.1, .warmup_steps = 4, .warmup_start_factor = 0.5};
    EXPECT_DOUBLE_EQ(LrScheduler::annealed_learning_rate(1.0, 0, options), 0.5);
    EXPECT_DOUBLE_EQ(LrScheduler::annealed_learning_rate(1.0, 2, options), 0.75);
    EXPECT_DOUBLE_EQ(LrScheduler::annealed_learning_rate(1.0, 4, options), 1.0);
    EXPECT_NEAR(LrScheduler::annealed_learning_rate(1.0, 9, options), 0.55, 1e-12);
    EXPECT_NEAR(LrScheduler::annealed_learning_rate(1.0, 14, options), 0.1, 1e-12);
    EXPECT_NEAR(LrScheduler::annealed_learning_rate(1.0, 100, options), 0.1, 1e-12);

    auto weight = torch::zeros({2}, torch::requires_grad());
    auto optimizer = Optimizer::build({weight}, Optimizer::SGD({.learning_rate = 1.0}));
    auto scheduler = LrScheduler::build(*optimizer, LrScheduler::CosineAnnealing({.T_max = 0, .eta_min = 0.0, .warmup_steps = 0, .warmup_start_factor = 0.0}), 4);
    EXPECT_DOUBLE_EQ(scheduler->current_lr(), 1.0);
    for (int step = 0; step < 4; ++step) {
        scheduler->step();
    }
    EXPECT_NEAR(scheduler->current_lr(), 0.0, 1e-12);
    EXPECT_NEAR(optimizer->param_groups().front().options().get_lr(), 0.0, 1e-12);
}
