#ifndef SKULD_PIPELINE_TRAINING_HPP
#define SKULD_PIPELINE_TRAINING_HPP

#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../common/cancellation.hpp"
#include "../../common/error.hpp"
#include "../../common/save_load.hpp"
#include "../../encoding/encoding.hpp"
#include "../../graph/graph.hpp"
#include "../../model/model.hpp"
#include "../../plan/plan.hpp"
#include "../../store/store.hpp"
#include "../../utils/progressbar.hpp"
#include "../../utils/terminal.hpp"
#include "cache.hpp"
#include "corpus.hpp"
#include "measurer.hpp"
#include "retry.hpp"

namespace Skuld::Pipeline::Details {
    enum class ReuseMode {
        Pretrained,     // load a stored predictor when one exists
        Train,          // always train
    };

    inline std::string to_string(ReuseMode mode)
    {
        return mode == ReuseMode::Pretrained ? "pretrained" : "train";
    }

    inline ReuseMode parse_reuse_mode(const std::string& value)
    {
        if (value == "pretrained") return ReuseMode::Pretrained;
        if (value == "train") return ReuseMode::Train;
        throw std::invalid_argument("Unknown reuse mode '" + value + "'. Expected pretrained or train.");
    }

    struct PipelineOptions {
        ReuseMode reuse{ReuseMode::Pretrained};
        bool overwrite{false};
        bool warm_start{true};
        bool use_cache{true};
        std::size_t checkpoint_interval{0};   // epochs between checkpoints, 0 persists only the final model
        RetryPolicy retry{};
        Encoding::EncoderOptions encoder{};
        Plan::HardwareProfile hardware{};
        Model::NetworkOptions network{};
        Model::FitOptions fit{};
        std::ostream* stream{&std::cout};
        Common::CancellationToken cancellation{};
    };

    struct TrainingOutcome {
        std::shared_ptr<const Model::PredictorModel> model{};
        bool loaded{false};
        std::size_t examples{0};
        std::size_t measured{0};
        std::size_t cached{0};
        std::size_t skipped{0};
        bool cancelled{false};
        std::optional<Model::FitReport> report{};
    };

    // Collects (plan, latency) examples for one key, fits the predictor and persists it.
    // Runs for the same key are serialized by the store's exclusive key lock.
    class TrainingPipeline {
    public:
        TrainingPipeline(std::shared_ptr<Store::ArtifactStore> store,
                         std::shared_ptr<Measurer> measurer,
                         PipelineOptions options = {})
            : store_(std::move(store)), measurer_(std::move(measurer)), options_(std::move(options))
        {
            if (!store_) {
                throw std::invalid_argument("TrainingPipeline requires an artifact store.");
            }
        }

        [[nodiscard]] const PipelineOptions& options() const noexcept { return options_; }
        [[nodiscard]] PipelineOptions& options() noexcept { return options_; }

        TrainingOutcome train_or_load(const Store::ArtifactKey& key,
                                      const std::vector<Plan::ExecutionPlan>& plans,
                                      const Plan::ModelSpec& spec)
        {
            Store::validate(key);
            auto* stream = options_.stream;

            if (options_.reuse == ReuseMode::Pretrained) {
                if (auto stored = store_->load(key)) {
                    Utils::Terminal::Success(stream, "Loaded predictor " + key.to_string() + " from '" + store_->location(key) + "'.");
                    return loaded(std::move(*stored));
                }
            }

            const auto guard = store_->lock(key);
            const auto existing = store_->contains(key);
            if (existing && options_.reuse == ReuseMode::Pretrained) {
                // Another run saved the record while this one waited for the lock.
                if (auto stored = store_->load(key)) {
                    Utils::Terminal::Success(stream, "Loaded predictor " + key.to_string() + " saved by a concurrent run.");
                    return loaded(std::move(*stored));
                }
            }
            if (existing && options_.reuse == ReuseMode::Train && !options_.overwrite) {
                throw Error::DestinationConflict(store_->location(key));
            }

            TrainingOutcome outcome{};
            auto cache = options_.use_cache ? read_cache(key) : MeasurementCache{};
            auto corpus = read_corpus(key);
            collect(plans, spec, cache, corpus, outcome);
            if (options_.use_cache) {
                store_->write_attachment(key, kMeasurementsFile, Common::SaveLoad::to_json_string(cache.to_property_tree()));
            }
            store_->write_attachment(key, kCorpusFile, Common::SaveLoad::to_json_string(corpus.to_property_tree()));

            if (outcome.skipped > 0) {
                Utils::Terminal::Warn(stream, "Skipped " + std::to_string(outcome.skipped) + " of "
                                              + std::to_string(plans.size()) + " plans while collecting examples.");
            }
            if (outcome.cancelled) {
                Utils::Terminal::Warn(stream, "Training of " + key.to_string() + " cancelled during collection.");
                return outcome;
            }

            auto examples = assemble(corpus, spec, outcome);
            outcome.examples = examples.size();

            auto model = initial_model(key, existing);
            const bool warm = model->freshness() != Model::Freshness::Untrained;

            auto fit_options = options_.fit;
            fit_options.warm_start = warm;
            fit_options.stream = stream;
            fit_options.cancellation = options_.cancellation;
            bool checkpointed = false;
            if (options_.checkpoint_interval > 0) {
                auto user_callback = fit_options.on_epoch;
                fit_options.on_epoch = [this, &key, &model, &checkpointed, user_callback](const Model::EpochReport& report) {
                    if (user_callback) {
                        user_callback(report);
                    }
                    if (report.epoch % options_.checkpoint_interval == 0) {
                        store_->checkpoint(key, *model);
                        checkpointed = true;
                    }
                };
            }

            Utils::Terminal::Info(stream, std::string(warm ? "Fine-tuning" : "Training") + " predictor " + key.to_string()
                                          + " on " + std::to_string(examples.size()) + " examples.");
            outcome.report = model->fit(examples, fit_options);
            if (outcome.report->cancelled) {
                outcome.cancelled = true;
                Utils::Terminal::Warn(stream, "Training of " + key.to_string() + " cancelled after "
                                              + std::to_string(outcome.report->epochs_completed) + " epochs; the final model was not saved.");
                return outcome;
            }

            std::shared_ptr<const Model::PredictorModel> trained = std::move(model);
            store_->save(key, trained, existing || checkpointed ? Store::SaveMode::Replace : Store::SaveMode::Create);
            Utils::Terminal::Success(stream, "Saved predictor " + key.to_string() + " to '" + store_->location(key) + "'.");
            outcome.model = std::move(trained);
            return outcome;
        }

        void reset_corpus(const Store::ArtifactKey& key)
        {
            const auto guard = store_->lock(key);
            store_->remove_attachment(key, kCorpusFile);
        }

        void reset_measurements(const Store::ArtifactKey& key)
        {
            const auto guard = store_->lock(key);
            store_->remove_attachment(key, kMeasurementsFile);
        }

        [[nodiscard]] Corpus corpus(const Store::ArtifactKey& key) const { return read_corpus(key); }

    private:
        static TrainingOutcome loaded(std::shared_ptr<const Model::PredictorModel> model)
        {
            TrainingOutcome outcome{};
            outcome.examples = model->example_count();
            outcome.model = std::move(model);
            outcome.loaded = true;
            return outcome;
        }

        [[nodiscard]] MeasurementCache read_cache(const Store::ArtifactKey& key) const
        {
            const auto text = store_->read_attachment(key, kMeasurementsFile);
            if (!text) {
                return {};
            }
            const auto context = std::string(kMeasurementsFile) + " of " + key.to_string();
            return MeasurementCache::from_property_tree(Common::SaveLoad::from_json_string(*text, context), context);
        }

        [[nodiscard]] Corpus read_corpus(const Store::ArtifactKey& key) const
        {
            const auto text = store_->read_attachment(key, kCorpusFile);
            if (!text) {
                return {};
            }
            const auto context = std::string(kCorpusFile) + " of " + key.to_string();
            return Corpus::from_property_tree(Common::SaveLoad::from_json_string(*text, context), context);
        }

        void skip(TrainingOutcome& outcome, const Plan::ExecutionPlan& plan, const std::string& reason) const
        {
            ++outcome.skipped;
            Utils::Terminal::Warn(options_.stream, "Skipping plan " + plan.signature() + ": " + reason);
        }

        void collect(const std::vector<Plan::ExecutionPlan>& plans,
                     const Plan::ModelSpec& spec,
                     MeasurementCache& cache,
                     Corpus& corpus,
                     TrainingOutcome& outcome)
        {
            const Encoding::GraphEncoder encoder(options_.encoder);
            Utils::ProgressBar progress(options_.stream, static_cast<std::int64_t>(plans.size()), "Collecting");

            for (const auto& plan : plans) {
                if (options_.cancellation.cancelled()) {
                    outcome.cancelled = true;
                    break;
                }
                const auto signature = plan.signature();
                progress.advance();
                if (corpus.contains(signature)) {
                    continue;
                }

                try {
                    static_cast<void>(encoder.encode(Graph::build(plan, spec, options_.hardware)));
                } catch (const Error::InvalidPlan& error) {
                    skip(outcome, plan, error.what());
                    continue;
                } catch (const Error::GraphTooLarge& error) {
                    skip(outcome, plan, error.what());
                    continue;
                }

                if (const auto latency = cache.latency(signature)) {
                    corpus.add(plan, *latency, Model::ExampleSource::Cached);
                    ++outcome.cached;
                    continue;
                }
                if (const auto excluded = cache.exclusion(signature)) {
                    skip(outcome, plan, "excluded by an earlier " + to_string(*excluded) + " failure");
                    continue;
                }
                if (!measurer_) {
                    skip(outcome, plan, "no cached latency and no measurer configured");
                    continue;
                }
                if (!measurer_->validate(plan)) {
                    cache.exclude(signature, FailureReason::Infeasible);
                    skip(outcome, plan, "rejected by the compiler");
                    continue;
                }

                const auto measurement = measure_with_retry(measurer_, plan, options_.retry, options_.cancellation);
                if (measurement.cancelled) {
                    outcome.cancelled = true;
                    break;
                }
                if (measurement.result.ok()) {
                    const auto latency = measurement.result.value();
                    if (!is_valid_latency(latency)) {
                        cache.exclude(signature, FailureReason::Error);
                        skip(outcome, plan, "measurer reported an unusable latency of " + std::to_string(latency) + " s");
                        continue;
                    }
                    cache.record(signature, latency);
                    corpus.add(plan, latency, Model::ExampleSource::Measured);
                    ++outcome.measured;
                    continue;
                }
                cache.exclude(signature, measurement.result.reason);
                skip(outcome, plan, to_string(measurement.result.reason) + " after " + std::to_string(measurement.attempts)
                                    + " attempt(s): " + measurement.result.message);
            }
            progress.complete();
        }

        // Encodes the whole corpus, including entries collected by earlier runs.
        std::vector<Model::TrainingExample> assemble(const Corpus& corpus, const Plan::ModelSpec& spec, TrainingOutcome& outcome) const
        {
            const Encoding::GraphEncoder encoder(options_.encoder);
            std::vector<Model::TrainingExample> examples;
            examples.reserve(corpus.size());
            for (const auto& entry : corpus.entries()) {
                try {
                    examples.push_back(Model::TrainingExample{
                        .plan = entry.plan,
                        .latency_seconds = entry.latency_seconds,
                        .source = entry.source,
                        .encoded = encoder.encode(Graph::build(entry.plan, spec, options_.hardware)),
                    });
                } catch (const Error::InvalidPlan& error) {
                    skip(outcome, entry.plan, error.what());
                } catch (const Error::GraphTooLarge& error) {
                    skip(outcome, entry.plan, error.what());
                }
            }
            return examples;
        }

        std::shared_ptr<Model::PredictorModel> initial_model(const Store::ArtifactKey& key, bool existing) const
        {
            if (options_.warm_start && existing) {
                try {
                    if (auto restored = store_->restore(key)) {
                        return std::shared_ptr<Model::PredictorModel>(std::move(restored));
                    }
                } catch (const Error::SchemaMismatch& error) {
                    Utils::Terminal::Warn(options_.stream, std::string("Cannot warm start: ") + error.what());
                }
            }
            return std::make_shared<Model::PredictorModel>(options_.network, options_.fit.seed);
        }

        std::shared_ptr<Store::ArtifactStore> store_;
        std::shared_ptr<Measurer> measurer_;
        PipelineOptions options_{};
    };
}

#endif // SKULD_PIPELINE_TRAINING_HPP
