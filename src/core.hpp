#ifndef SKULD_CORE_HPP
#define SKULD_CORE_HPP
/*
 * Core orchestrator of the framework.
 * ---------------------------------------------------------------------------
 *  - Binds one Settings instance (benchmark, cluster, encoder, network, fit,
 *    pipeline and search knobs) to the artifact store it names.
 *  - Routes requests to the module factories: plan enumeration, the training
 *    pipeline and the plan search. Nothing here owns an algorithm.
 *  - Hands out the trained predictor as a shared, immutable LatencyEstimator so
 *    searches may run concurrently against it.
 */

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/cancellation.hpp"
#include "config/config.hpp"
#include "model/model.hpp"
#include "pipeline/pipeline.hpp"
#include "plan/plan.hpp"
#include "search/search.hpp"
#include "store/store.hpp"
#include "utils/terminal.hpp"

namespace Skuld {
    class Planner {
    public:
        explicit Planner(Config::Settings settings,
                         std::shared_ptr<Pipeline::Measurer> measurer = nullptr,
                         std::shared_ptr<Store::ArtifactStore> store = nullptr)
            : settings_(std::move(settings)),
              spec_(Config::model_spec(settings_)),
              key_(Store::make_key(settings_.benchmark, settings_.mesh, settings_.hardware)),
              measurer_(std::move(measurer)),
              store_(store ? std::move(store) : std::make_shared<Store::ArtifactStore>(settings_.storage_location)),
              stream_(settings_.verbose ? &std::cout : nullptr)
        {
            Store::validate(key_);
        }

        Planner(const Planner&) = delete;
        Planner& operator=(const Planner&) = delete;

        [[nodiscard]] const Config::Settings& settings() const noexcept { return settings_; }
        [[nodiscard]] const Plan::ModelSpec& spec() const noexcept { return spec_; }
        [[nodiscard]] const Store::ArtifactKey& key() const noexcept { return key_; }
        [[nodiscard]] const Plan::DeviceMesh& mesh() const noexcept { return settings_.mesh; }
        [[nodiscard]] Store::ArtifactStore& store() const noexcept { return *store_; }

        [[nodiscard]] std::ostream* stream() const noexcept { return stream_; }
        void set_stream(std::ostream* stream) noexcept { stream_ = stream; }

        [[nodiscard]] Common::CancellationToken cancellation() const { return cancellation_; }
        void cancel() { cancellation_.cancel(); }

        // Plans profiled to build the training corpus.
        [[nodiscard]] std::vector<Plan::ExecutionPlan> training_plans() const
        {
            return Pipeline::generate_training_plans(spec_, settings_.mesh, Config::training_plan_options(settings_));
        }

        Pipeline::TrainingOutcome train_or_load() { return train_or_load(training_plans()); }

        Pipeline::TrainingOutcome train_or_load(const std::vector<Plan::ExecutionPlan>& plans)
        {
            auto options = Config::pipeline_options(settings_);
            options.stream = stream_;
            options.fit.stream = stream_;
            options.cancellation = cancellation_;
            Pipeline::TrainingPipeline pipeline(store_, measurer_, std::move(options));
            auto outcome = pipeline.train_or_load(key_, plans, spec_);
            if (outcome.model) {
                predictor_ = outcome.model;
            }
            return outcome;
        }

        // Stored predictor for this planner's key; throws when none was trained yet.
        [[nodiscard]] std::shared_ptr<const Model::PredictorModel> predictor()
        {
            if (predictor_) {
                return predictor_;
            }
            auto stored = store_->load(key_);
            if (!stored) {
                throw std::runtime_error("No predictor stored for " + key_.to_string() + " at '" + store_->location(key_)
                                         + "'. Train one first.");
            }
            predictor_ = std::move(*stored);
            return predictor_;
        }

        [[nodiscard]] Search::SearchSpace search_space() const
        {
            return Search::SearchSpace::enumerate(spec_, settings_.mesh, Config::space_options(settings_));
        }

        Search::SearchResult search() { return search(*predictor()); }

        Search::SearchResult search(const Model::LatencyEstimator& estimator) const
        {
            return search(search_space(), estimator);
        }

        Search::SearchResult search(const Search::SearchSpace& space, const Model::LatencyEstimator& estimator) const
        {
            auto options = Config::search_options(settings_);
            options.stream = stream_;
            options.cancellation = cancellation_;
            return Search::PlanSearch(std::move(options)).search(spec_, space, estimator);
        }

        // Predicted latency of caller-authored plans, in input order.
        [[nodiscard]] std::vector<Search::RankedPlan> query(const std::vector<Plan::ExecutionPlan>& plans,
                                                            const Model::LatencyEstimator& estimator) const
        {
            return Search::predict_plans(spec_, plans, estimator, settings_.encoder, settings_.hardware);
        }

        [[nodiscard]] std::vector<Search::RankedPlan> query(const std::vector<Plan::ExecutionPlan>& plans)
        {
            return query(plans, *predictor());
        }

        void print_ranking(const Search::SearchResult& result, std::size_t top = 10) const
        {
            if (stream_ == nullptr || result.ranked.empty()) {
                return;
            }
            namespace Terminal = Utils::Terminal;
            const std::vector<std::size_t> spacings{6, 14, 16, 48};
            const auto color = Terminal::Colors::kBrightBlack;
            *stream_ << Terminal::HSeparator(spacings, color, Terminal::HSepKind::Top) << '\n';
            *stream_ << Terminal::Row({"Rank", "Latency (s)", "Comm (bytes)", "Plan"}, spacings, color) << '\n';
            *stream_ << Terminal::HSeparator(spacings, color, Terminal::HSepKind::Middle) << '\n';
            const auto count = std::min(top, result.ranked.size());
            for (std::size_t index = 0; index < count; ++index) {
                const auto& entry = result.ranked[index];
                std::ostringstream latency;
                latency << std::setprecision(6) << entry.predicted_latency;
                std::ostringstream volume;
                volume << std::scientific << std::setprecision(3) << entry.communication_volume;
                *stream_ << Terminal::Row({std::to_string(index + 1), latency.str(), volume.str(), entry.plan.signature()},
                                          spacings, color) << '\n';
            }
            *stream_ << Terminal::HSeparator(spacings, color, Terminal::HSepKind::Bottom) << '\n';
        }

    private:
        Config::Settings settings_;
        Plan::ModelSpec spec_;
        Store::ArtifactKey key_;
        std::shared_ptr<Pipeline::Measurer> measurer_;
        std::shared_ptr<Store::ArtifactStore> store_;
        std::shared_ptr<const Model::PredictorModel> predictor_{};
        std::ostream* stream_{&std::cout};
        Common::CancellationToken cancellation_{};
    };
}

#endif // SKULD_CORE_HPP
