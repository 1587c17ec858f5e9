#ifndef SKULD_CONFIG_SETTINGS_HPP
#define SKULD_CONFIG_SETTINGS_HPP

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../common/save_load.hpp"
#include "../../encoding/encoding.hpp"
#include "../../loss/loss.hpp"
#include "../../lrscheduler/lrscheduler.hpp"
#include "../../model/model.hpp"
#include "../../optimizer/optimizer.hpp"
#include "../../pipeline/pipeline.hpp"
#include "../../plan/plan.hpp"
#include "../../search/search.hpp"

namespace Skuld::Config::Details {
    struct FitSettings {
        std::size_t epochs{60};
        std::size_t batch_size{16};
        std::size_t min_examples{10};
        double validation_fraction{0.2};
        bool restore_best_state{true};
        std::uint64_t seed{42};
        double gradient_clip{1.0};
        std::string loss{"mse"};
        std::string optimizer{"adamw"};
        double learning_rate{1e-3};
        bool cosine_schedule{true};
        std::size_t warmup_steps{0};
        double eta_min{0.0};
    };

    struct PipelineSettings {
        std::string reuse{"pretrained"};
        bool overwrite{false};
        bool warm_start{true};
        bool use_cache{true};
        std::size_t checkpoint_interval{0};
        std::size_t max_attempts{3};
        std::int64_t timeout_ms{600000};
        std::int64_t backoff_ms{200};
        double sampling_probability{1.0};
        std::size_t sampling_reduce{0};
        std::vector<std::size_t> sampling_exclude{};
        std::size_t max_training_plans{256};
        std::int64_t max_micro_batches{16};
        std::size_t splits_per_partition{4};
        std::uint64_t seed{0};
    };

    struct SearchSettings {
        std::size_t budget{0};
        std::uint64_t seed{0};
        std::size_t workers{0};
        std::size_t batch_size{16};
        std::size_t layer_groups{4};
        std::size_t max_stages{4};
        std::int64_t max_micro_batches{16};
        std::size_t splits_per_stage_count{0};
    };

    struct Settings {
        std::filesystem::path storage_location{"skuld_artifacts"};
        Plan::Benchmark benchmark{Plan::Benchmark::MixtureOfExperts};
        std::optional<Plan::ModelPreset> model{};   // empty: the benchmark's default preset
        Plan::DeviceMesh mesh{1, 8};
        Plan::HardwareProfile hardware{};
        Encoding::EncoderOptions encoder{};
        Model::NetworkOptions network{};
        FitSettings fit{};
        PipelineSettings pipeline{};
        SearchSettings search{};
        bool verbose{true};
    };

    inline std::string to_string(Encoding::AttentionPolicy policy)
    {
        return policy == Encoding::AttentionPolicy::DependencyMasked ? "dependency_masked" : "bidirectional";
    }

    inline Encoding::AttentionPolicy parse_attention_policy(const std::string& value)
    {
        if (value == "dependency_masked") return Encoding::AttentionPolicy::DependencyMasked;
        if (value == "bidirectional") return Encoding::AttentionPolicy::Bidirectional;
        throw std::runtime_error("Unknown attention policy '" + value + "'. Expected dependency_masked or bidirectional.");
    }

    inline Plan::ModelSpec model_spec(const Settings& settings)
    {
        if (settings.model) {
            return Plan::make_model_spec(settings.benchmark, *settings.model);
        }
        return Plan::default_model(settings.benchmark);
    }

    inline Model::FitOptions fit_options(const Settings& settings)
    {
        const auto& fit = settings.fit;
        Model::FitOptions options{};
        options.epochs = fit.epochs;
        options.batch_size = fit.batch_size;
        options.min_examples = fit.min_examples;
        options.validation_fraction = fit.validation_fraction;
        options.restore_best_state = fit.restore_best_state;
        options.seed = fit.seed;
        options.gradient_clip = fit.gradient_clip;
        options.loss = Loss::parse_descriptor(fit.loss);
        options.optimizer = Optimizer::parse_descriptor(fit.optimizer, fit.learning_rate);
        if (fit.cosine_schedule) {
            options.scheduler = LrScheduler::CosineAnnealing({.T_max = 0, .eta_min = fit.eta_min, .warmup_steps = fit.warmup_steps, .warmup_start_factor = 0.0});
        }
        options.monitor = settings.verbose;
        return options;
    }

    inline Pipeline::PipelineOptions pipeline_options(const Settings& settings)
    {
        const auto& pipeline = settings.pipeline;
        Pipeline::PipelineOptions options{};
        options.reuse = Pipeline::parse_reuse_mode(pipeline.reuse);
        options.overwrite = pipeline.overwrite;
        options.warm_start = pipeline.warm_start;
        options.use_cache = pipeline.use_cache;
        options.checkpoint_interval = pipeline.checkpoint_interval;
        options.retry = Pipeline::RetryPolicy{
            .max_attempts = pipeline.max_attempts,
            .timeout = std::chrono::milliseconds(pipeline.timeout_ms),
            .backoff = std::chrono::milliseconds(pipeline.backoff_ms),
        };
        options.encoder = settings.encoder;
        options.hardware = settings.hardware;
        options.network = settings.network;
        options.fit = fit_options(settings);
        return options;
    }

    inline Pipeline::TrainingPlanOptions training_plan_options(const Settings& settings)
    {
        const auto& pipeline = settings.pipeline;
        return Pipeline::TrainingPlanOptions{
            .sampling = {
                .probability = pipeline.sampling_probability,
                .reduce = pipeline.sampling_reduce,
                .exclude = pipeline.sampling_exclude,
                .seed = pipeline.seed,
            },
            .max_micro_batches = pipeline.max_micro_batches,
            .splits_per_partition = pipeline.splits_per_partition,
            .max_plans = pipeline.max_training_plans,
            .seed = pipeline.seed,
        };
    }

    inline Search::SearchOptions search_options(const Settings& settings)
    {
        Search::SearchOptions options{};
        options.budget = settings.search.budget;
        options.seed = settings.search.seed;
        options.workers = settings.search.workers;
        options.batch_size = settings.search.batch_size;
        options.encoder = settings.encoder;
        options.hardware = settings.hardware;
        return options;
    }

    inline Search::SearchSpaceOptions space_options(const Settings& settings)
    {
        return Search::SearchSpaceOptions{
            .layer_groups = settings.search.layer_groups,
            .max_stages = settings.search.max_stages,
            .max_micro_batches = settings.search.max_micro_batches,
            .splits_per_stage_count = settings.search.splits_per_stage_count,
        };
    }

    inline Common::SaveLoad::PropertyTree to_property_tree(const Settings& settings)
    {
        using Common::SaveLoad::PropertyTree;
        PropertyTree tree;
        tree.put("storage_location", settings.storage_location.string());
        tree.put("benchmark", Plan::to_string(settings.benchmark));
        tree.put("verbose", settings.verbose);

        if (settings.model) {
            const auto& preset = *settings.model;
            PropertyTree model;
            model.put("name", preset.name);
            model.put("num_layers", preset.num_layers);
            model.put("hidden_size", preset.hidden_size);
            model.put("num_heads", preset.num_heads);
            model.put("sequence_length", preset.sequence_length);
            model.put("global_batch_size", preset.global_batch_size);
            model.put("vocab_size", preset.vocab_size);
            model.put("num_experts", preset.num_experts);
            model.put("expert_interval", preset.expert_interval);
            model.put("top_k", preset.top_k);
            model.put("bytes_per_element", preset.bytes_per_element);
            tree.add_child("model", model);
        }

        tree.put("cluster.hosts", settings.mesh.hosts);
        tree.put("cluster.devices_per_host", settings.mesh.devices_per_host);
        tree.put("cluster.hardware.name", settings.hardware.name);
        tree.put("cluster.hardware.device_flops", settings.hardware.device_flops);
        tree.put("cluster.hardware.intra_host_bandwidth", settings.hardware.intra_host_bandwidth);
        tree.put("cluster.hardware.inter_host_bandwidth", settings.hardware.inter_host_bandwidth);
        tree.put("cluster.hardware.prefer_reduce_scatter", settings.hardware.prefer_reduce_scatter);

        tree.put("encoder.max_nodes", settings.encoder.max_nodes);
        tree.put("encoder.policy", to_string(settings.encoder.policy));
        tree.put("encoder.depth_bias_scale", settings.encoder.depth_bias_scale);

        tree.add_child("network", Model::to_property_tree(settings.network));

        const auto& fit = settings.fit;
        tree.put("fit.epochs", fit.epochs);
        tree.put("fit.batch_size", fit.batch_size);
        tree.put("fit.min_examples", fit.min_examples);
        tree.put("fit.validation_fraction", fit.validation_fraction);
        tree.put("fit.restore_best_state", fit.restore_best_state);
        tree.put("fit.seed", fit.seed);
        tree.put("fit.gradient_clip", fit.gradient_clip);
        tree.put("fit.loss", fit.loss);
        tree.put("fit.optimizer", fit.optimizer);
        tree.put("fit.learning_rate", fit.learning_rate);
        tree.put("fit.cosine_schedule", fit.cosine_schedule);
        tree.put("fit.warmup_steps", fit.warmup_steps);
        tree.put("fit.eta_min", fit.eta_min);

        const auto& pipeline = settings.pipeline;
        tree.put("pipeline.reuse", pipeline.reuse);
        tree.put("pipeline.overwrite", pipeline.overwrite);
        tree.put("pipeline.warm_start", pipeline.warm_start);
        tree.put("pipeline.use_cache", pipeline.use_cache);
        tree.put("pipeline.checkpoint_interval", pipeline.checkpoint_interval);
        tree.put("pipeline.max_attempts", pipeline.max_attempts);
        tree.put("pipeline.timeout_ms", pipeline.timeout_ms);
        tree.put("pipeline.backoff_ms", pipeline.backoff_ms);
        tree.put("pipeline.sampling_probability", pipeline.sampling_probability);
        tree.put("pipeline.sampling_reduce", pipeline.sampling_reduce);
        tree.add_child("pipeline.sampling_exclude", Common::SaveLoad::Detail::write_array(pipeline.sampling_exclude));
        tree.put("pipeline.max_training_plans", pipeline.max_training_plans);
        tree.put("pipeline.max_micro_batches", pipeline.max_micro_batches);
        tree.put("pipeline.splits_per_partition", pipeline.splits_per_partition);
        tree.put("pipeline.seed", pipeline.seed);

        const auto& search = settings.search;
        tree.put("search.budget", search.budget);
        tree.put("search.seed", search.seed);
        tree.put("search.workers", search.workers);
        tree.put("search.batch_size", search.batch_size);
        tree.put("search.layer_groups", search.layer_groups);
        tree.put("search.max_stages", search.max_stages);
        tree.put("search.max_micro_batches", search.max_micro_batches);
        tree.put("search.splits_per_stage_count", search.splits_per_stage_count);
        return tree;
    }

    // Missing keys keep their defaults; malformed values raise std::runtime_error naming the key.
    inline Settings settings_from_property_tree(const Common::SaveLoad::PropertyTree& tree, const std::string& context)
    {
        using Common::SaveLoad::Detail::read_optional;
        Settings settings{};

        if (const auto location = tree.get_optional<std::string>("storage_location")) {
            settings.storage_location = *location;
        }
        if (const auto benchmark = tree.get_optional<std::string>("benchmark")) {
            try {
                settings.benchmark = Plan::parse_benchmark(*benchmark);
            } catch (const std::invalid_argument& error) {
                throw std::runtime_error("Malformed value for 'benchmark' in " + context + ": " + error.what());
            }
        }
        read_optional(tree, "verbose", settings.verbose, context);

        if (const auto model = tree.get_child_optional("model")) {
            Plan::ModelPreset preset = settings.benchmark == Plan::Benchmark::MixtureOfExperts ? Plan::moe_1_3b_preset()
                                                                                              : Plan::gpt_1_3b_preset();
            read_optional(*model, "name", preset.name, context);
            read_optional(*model, "num_layers", preset.num_layers, context);
            read_optional(*model, "hidden_size", preset.hidden_size, context);
            read_optional(*model, "num_heads", preset.num_heads, context);
            read_optional(*model, "sequence_length", preset.sequence_length, context);
            read_optional(*model, "global_batch_size", preset.global_batch_size, context);
            read_optional(*model, "vocab_size", preset.vocab_size, context);
            read_optional(*model, "num_experts", preset.num_experts, context);
            read_optional(*model, "expert_interval", preset.expert_interval, context);
            read_optional(*model, "top_k", preset.top_k, context);
            read_optional(*model, "bytes_per_element", preset.bytes_per_element, context);
            settings.model = preset;
        }

        read_optional(tree, "cluster.hosts", settings.mesh.hosts, context);
        read_optional(tree, "cluster.devices_per_host", settings.mesh.devices_per_host, context);
        read_optional(tree, "cluster.hardware.name", settings.hardware.name, context);
        read_optional(tree, "cluster.hardware.device_flops", settings.hardware.device_flops, context);
        read_optional(tree, "cluster.hardware.intra_host_bandwidth", settings.hardware.intra_host_bandwidth, context);
        read_optional(tree, "cluster.hardware.inter_host_bandwidth", settings.hardware.inter_host_bandwidth, context);
        read_optional(tree, "cluster.hardware.prefer_reduce_scatter", settings.hardware.prefer_reduce_scatter, context);
        if (settings.mesh.hosts < 1 || settings.mesh.devices_per_host < 1) {
            throw std::runtime_error("Malformed value for 'cluster' in " + context + ": the mesh needs at least one device.");
        }
        for (const auto& [key, rate] : {std::pair{"device_flops", settings.hardware.device_flops},
                                        std::pair{"intra_host_bandwidth", settings.hardware.intra_host_bandwidth},
                                        std::pair{"inter_host_bandwidth", settings.hardware.inter_host_bandwidth}}) {
            if (!std::isfinite(rate) || rate <= 0.0) {
                throw std::runtime_error(std::string("Malformed value for 'cluster.hardware.") + key + "' in " + context
                                         + ": expected a positive rate, got " + std::to_string(rate) + ".");
            }
        }

        read_optional(tree, "encoder.max_nodes", settings.encoder.max_nodes, context);
        read_optional(tree, "encoder.depth_bias_scale", settings.encoder.depth_bias_scale, context);
        if (const auto policy = tree.get_optional<std::string>("encoder.policy")) {
            settings.encoder.policy = parse_attention_policy(*policy);
        }

        if (const auto network = tree.get_child_optional("network")) {
            try {
                settings.network = Model::network_options_from(*network, context);
            } catch (const std::invalid_argument& error) {
                throw std::runtime_error("Malformed value in 'network' of " + context + ": " + error.what());
            }
        }

        auto& fit = settings.fit;
        read_optional(tree, "fit.epochs", fit.epochs, context);
        read_optional(tree, "fit.batch_size", fit.batch_size, context);
        read_optional(tree, "fit.min_examples", fit.min_examples, context);
        read_optional(tree, "fit.validation_fraction", fit.validation_fraction, context);
        read_optional(tree, "fit.restore_best_state", fit.restore_best_state, context);
        read_optional(tree, "fit.seed", fit.seed, context);
        read_optional(tree, "fit.gradient_clip", fit.gradient_clip, context);
        read_optional(tree, "fit.loss", fit.loss, context);
        read_optional(tree, "fit.optimizer", fit.optimizer, context);
        read_optional(tree, "fit.learning_rate", fit.learning_rate, context);
        read_optional(tree, "fit.cosine_schedule", fit.cosine_schedule, context);
        read_optional(tree, "fit.warmup_steps", fit.warmup_steps, context);
        read_optional(tree, "fit.eta_min", fit.eta_min, context);

        auto& pipeline = settings.pipeline;
        read_optional(tree, "pipeline.reuse", pipeline.reuse, context);
        read_optional(tree, "pipeline.overwrite", pipeline.overwrite, context);
        read_optional(tree, "pipeline.warm_start", pipeline.warm_start, context);
        read_optional(tree, "pipeline.use_cache", pipeline.use_cache, context);
        read_optional(tree, "pipeline.checkpoint_interval", pipeline.checkpoint_interval, context);
        read_optional(tree, "pipeline.max_attempts", pipeline.max_attempts, context);
        read_optional(tree, "pipeline.timeout_ms", pipeline.timeout_ms, context);
        read_optional(tree, "pipeline.backoff_ms", pipeline.backoff_ms, context);
        read_optional(tree, "pipeline.sampling_probability", pipeline.sampling_probability, context);
        read_optional(tree, "pipeline.sampling_reduce", pipeline.sampling_reduce, context);
        if (const auto exclude = tree.get_child_optional("pipeline.sampling_exclude")) {
            pipeline.sampling_exclude = Common::SaveLoad::Detail::read_array<std::size_t>(*exclude, context);
        }
        read_optional(tree, "pipeline.max_training_plans", pipeline.max_training_plans, context);
        read_optional(tree, "pipeline.max_micro_batches", pipeline.max_micro_batches, context);
        read_optional(tree, "pipeline.splits_per_partition", pipeline.splits_per_partition, context);
        read_optional(tree, "pipeline.seed", pipeline.seed, context);

        auto& search = settings.search;
        read_optional(tree, "search.budget", search.budget, context);
        read_optional(tree, "search.seed", search.seed, context);
        read_optional(tree, "search.workers", search.workers, context);
        read_optional(tree, "search.batch_size", search.batch_size, context);
        read_optional(tree, "search.layer_groups", search.layer_groups, context);
        read_optional(tree, "search.max_stages", search.max_stages, context);
        read_optional(tree, "search.max_micro_batches", search.max_micro_batches, context);
        read_optional(tree, "search.splits_per_stage_count", search.splits_per_stage_count, context);

        // Names are checked here so a bad file fails at load time rather than at training time.
        try {
            static_cast<void>(Loss::parse_descriptor(fit.loss));
            static_cast<void>(Optimizer::parse_descriptor(fit.optimizer, fit.learning_rate));
            static_cast<void>(Pipeline::parse_reuse_mode(pipeline.reuse));
        } catch (const std::invalid_argument& error) {
            throw std::runtime_error("Malformed value in " + context + ": " + error.what());
        }
        return settings;
    }

    inline Settings load_settings(const std::filesystem::path& path)
    {
        if (!std::filesystem::is_regular_file(path)) {
            throw std::runtime_error("Settings file '" + path.string() + "' does not exist.");
        }
        return settings_from_property_tree(Common::SaveLoad::read_json_file(path), "settings '" + path.string() + "'");
    }

    inline void save_settings(const std::filesystem::path& path, const Settings& settings)
    {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        Common::SaveLoad::write_json_file(path, to_property_tree(settings));
    }
}

#endif // SKULD_CONFIG_SETTINGS_HPP
