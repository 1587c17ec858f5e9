#ifndef SKULD_TEST_UTILS_HPP
#define SKULD_TEST_UTILS_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../include/Skuld.h"

namespace Skuld::Testing {
    // Four dense layers, small enough to train in a few seconds on a CPU.
    inline Plan::ModelPreset tiny_preset()
    {
        return Plan::ModelPreset{
            .name = "tiny-gpt",
            .num_layers = 4,
            .hidden_size = 32,
            .num_heads = 4,
            .sequence_length = 16,
            .global_batch_size = 8,
            .vocab_size = 64,
            .num_experts = 0,
            .expert_interval = 2,
            .top_k = 2,
            .bytes_per_element = 2,
        };
    }

    inline Plan::ModelSpec tiny_spec()
    {
        return Plan::make_model_spec(Plan::Benchmark::DenseTransformer, tiny_preset());
    }

    inline Plan::ModelSpec tiny_moe_spec()
    {
        auto preset = tiny_preset();
        preset.name = "tiny-moe";
        preset.num_experts = 4;
        return Plan::make_model_spec(Plan::Benchmark::MixtureOfExperts, preset);
    }

    inline Plan::DeviceMesh tiny_mesh() { return Plan::DeviceMesh{1, 4}; }

    inline Plan::ExecutionPlan single_stage(std::int64_t data, std::int64_t tensor, std::int64_t micro_batches,
                                            const Plan::DeviceMesh& mesh = tiny_mesh(), std::size_t layers = 4)
    {
        return Plan::ExecutionPlan(mesh,
                                   {Plan::StageAssignment{
                                       .first_layer = 0,
                                       .last_layer = layers - 1,
                                       .degrees = {data, tensor, 1},
                                       .submesh = {1, mesh.devices_per_host},
                                       .device_offset = 0,
                                   }},
                                   micro_batches);
    }

    // Layers [0, 1] on devices 0-1 and [2, 3] on devices 2-3.
    inline Plan::ExecutionPlan two_stage(std::int64_t data, std::int64_t tensor, std::int64_t micro_batches)
    {
        const auto mesh = tiny_mesh();
        std::vector<Plan::StageAssignment> stages{
            {.first_layer = 0, .last_layer = 1, .degrees = {data, tensor, 2}, .submesh = {1, 2}, .device_offset = 0},
            {.first_layer = 2, .last_layer = 3, .degrees = {data, tensor, 2}, .submesh = {1, 2}, .device_offset = 2},
        };
        return Plan::ExecutionPlan(mesh, std::move(stages), micro_batches);
    }

    // Eight distinct feasible plans for the tiny model on the 1x4 mesh.
    inline std::vector<Plan::ExecutionPlan> eight_plans()
    {
        return {
            single_stage(4, 1, 1),
            single_stage(2, 2, 1),
            single_stage(1, 4, 1),
            single_stage(4, 1, 2),
            single_stage(2, 2, 2),
            single_stage(1, 4, 2),
            two_stage(2, 1, 1),
            two_stage(1, 2, 1),
        };
    }

    // Every feasible plan of the tiny model, up to `limit`.
    inline std::vector<Plan::ExecutionPlan> candidate_plans(std::size_t limit = 0)
    {
        auto plans = Search::SearchSpace::enumerate(tiny_spec(), tiny_mesh()).candidates();
        if (limit > 0 && plans.size() > limit) {
            plans.resize(limit);
        }
        return plans;
    }

    inline Encoding::EncodedGraph encode(const Plan::ExecutionPlan& plan, const Plan::ModelSpec& spec = tiny_spec(),
                                         const Encoding::EncoderOptions& options = {})
    {
        return Encoding::GraphEncoder(options).encode(Graph::build(plan, spec));
    }

    // Deterministic, plan-dependent latency in seconds.
    inline double synthetic_latency(const Plan::ExecutionPlan& plan)
    {
        double latency = 0.02 + 0.001 * static_cast<double>(plan.micro_batches());
        for (const auto& stage : plan.stages()) {
            latency += 0.004 * static_cast<double>(stage.layer_count()) / static_cast<double>(stage.submesh.size());
            latency += 0.003 * static_cast<double>(stage.degrees.tensor - 1);
        }
        return latency + 0.005 * static_cast<double>(plan.stage_count() - 1);
    }

    inline std::vector<Model::TrainingExample> training_examples(const std::vector<Plan::ExecutionPlan>& plans)
    {
        std::vector<Model::TrainingExample> examples;
        examples.reserve(plans.size());
        for (const auto& plan : plans) {
            examples.push_back(Model::TrainingExample{
                .plan = plan,
                .latency_seconds = synthetic_latency(plan),
                .source = Model::ExampleSource::Measured,
                .encoded = encode(plan),
            });
        }
        return examples;
    }

    inline Model::NetworkOptions small_network()
    {
        Model::NetworkOptions options{};
        options.embed_dim = 16;
        options.num_heads = 2;
        options.layers = 1;
        options.readout_hidden = 16;
        return options;
    }

    inline Model::FitOptions quick_fit(std::size_t epochs = 8)
    {
        Model::FitOptions options{};
        options.epochs = epochs;
        options.batch_size = 4;
        options.min_examples = 4;
        options.validation_fraction = 0.0;
        options.optimizer = Optimizer::AdamW({.learning_rate = 5e-3});
        options.monitor = false;
        options.stream = nullptr;
        return options;
    }

    class SyntheticMeasurer : public Pipeline::Measurer {
    public:
        Pipeline::MeasurementResult measure(const Plan::ExecutionPlan& plan) override
        {
            ++calls_;
            return Pipeline::MeasurementResult::success(synthetic_latency(plan));
        }

        [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }

    private:
        std::atomic<std::size_t> calls_{0};
    };

    // Fails the listed plans with a fixed reason; the compiler rejects the `rejected` ones outright.
    class FailingMeasurer : public SyntheticMeasurer {
    public:
        FailingMeasurer(std::set<std::string> failing, Pipeline::FailureReason reason, std::set<std::string> rejected = {})
            : failing_(std::move(failing)), rejected_(std::move(rejected)), reason_(reason) {}

        Pipeline::MeasurementResult measure(const Plan::ExecutionPlan& plan) override
        {
            if (failing_.contains(plan.signature())) {
                ++failures_;
                return Pipeline::MeasurementResult::failure(reason_, "synthetic failure");
            }
            return SyntheticMeasurer::measure(plan);
        }

        bool validate(const Plan::ExecutionPlan& plan) override { return !rejected_.contains(plan.signature()); }

        [[nodiscard]] std::size_t failures() const noexcept { return failures_.load(); }

    private:
        std::set<std::string> failing_;
        std::set<std::string> rejected_;
        Pipeline::FailureReason reason_;
        std::atomic<std::size_t> failures_{0};
    };

    // Throws on the first `failures` calls for each plan, then succeeds.
    class FlakyMeasurer : public Pipeline::Measurer {
    public:
        explicit FlakyMeasurer(std::size_t failures) : failures_(failures) {}

        Pipeline::MeasurementResult measure(const Plan::ExecutionPlan& plan) override
        {
            std::size_t attempt = 0;
            {
                std::lock_guard<std::mutex> guard(mutex_);
                attempt = attempts_[plan.signature()]++;
            }
            if (attempt < failures_) {
                throw std::runtime_error("transient compiler error");
            }
            return Pipeline::MeasurementResult::success(synthetic_latency(plan));
        }

        [[nodiscard]] std::size_t attempts(const std::string& signature) const
        {
            std::lock_guard<std::mutex> guard(mutex_);
            const auto found = attempts_.find(signature);
            return found == attempts_.end() ? 0 : found->second;
        }

    private:
        std::size_t failures_;
        mutable std::mutex mutex_;
        std::map<std::string, std::size_t> attempts_;
    };

    // Predicts a fixed latency per plan signature.
    class LookupEstimator : public Model::LatencyEstimator {
    public:
        explicit LookupEstimator(std::map<std::string, double> latencies, double fallback = 1.0)
            : latencies_(std::move(latencies)), fallback_(fallback) {}

        [[nodiscard]] double predict(const Encoding::EncodedGraph& encoded) const override
        {
            const auto found = latencies_.find(encoded.signature);
            return found == latencies_.end() ? fallback_ : found->second;
        }

    private:
        std::map<std::string, double> latencies_;
        double fallback_;
    };

    // Scratch directory removed at scope exit.
    class TemporaryDirectory {
    public:
        TemporaryDirectory()
        {
            std::random_device device;
            path_ = std::filesystem::temp_directory_path() / ("skuld-test-" + std::to_string(device()) + std::to_string(device()));
            std::filesystem::create_directories(path_);
        }

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        ~TemporaryDirectory()
        {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };
}

#endif // SKULD_TEST_UTILS_HPP
