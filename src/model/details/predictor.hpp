#ifndef SKULD_MODEL_PREDICTOR_HPP
#define SKULD_MODEL_PREDICTOR_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <memory>
#include <numeric>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "../../common/save_load.hpp"
#include "../../encoding/encoding.hpp"
#include "../../loss/loss.hpp"
#include "../../lrscheduler/lrscheduler.hpp"
#include "../../optimizer/optimizer.hpp"
#include "../../utils/terminal.hpp"
#include "estimator.hpp"
#include "example.hpp"
#include "network.hpp"
#include "normalizer.hpp"
#include "options.hpp"

namespace Skuld::Model::Details {
    enum class Freshness {
        Untrained,
        Trained,
        Loaded,
    };

    inline std::string to_string(Freshness freshness)
    {
        switch (freshness) {
            case Freshness::Untrained: return "untrained";
            case Freshness::Trained:   return "trained";
            case Freshness::Loaded:    return "loaded";
        }
        return "unknown";
    }

    class PredictorModel final : public LatencyEstimator {
    public:
        static constexpr int kFormatVersion = 1;
        static constexpr std::size_t kInferenceChunk = 64;

        explicit PredictorModel(NetworkOptions options = {}, std::uint64_t seed = 42)
            : options_(std::move(options)), seed_(seed)
        {
            initialise();
        }

        PredictorModel(const PredictorModel&) = delete;
        PredictorModel& operator=(const PredictorModel&) = delete;

        [[nodiscard]] double predict(const Encoding::EncodedGraph& encoded) const override
        {
            return predict_batch({&encoded}).front();
        }

        // Safe to call from several threads at once: eval mode, no autograd, nothing written.
        [[nodiscard]] std::vector<double> predict_batch(const std::vector<const Encoding::EncodedGraph*>& encoded) const override
        {
            for (const auto* graph : encoded) {
                if (graph == nullptr) {
                    throw std::invalid_argument("predict_batch received a null encoded graph.");
                }
                check_compatible(*graph);
            }

            torch::NoGradGuard no_grad;
            std::vector<double> latencies;
            latencies.reserve(encoded.size());
            for (std::size_t offset = 0; offset < encoded.size(); offset += kInferenceChunk) {
                const auto end = std::min(encoded.size(), offset + kInferenceChunk);
                const std::vector<const Encoding::EncodedGraph*> chunk(encoded.begin() + static_cast<std::ptrdiff_t>(offset),
                                                                       encoded.begin() + static_cast<std::ptrdiff_t>(end));
                auto z = network_.ptr()->forward(Encoding::collate(chunk)).to(torch::kFloat64).contiguous();
                auto access = z.accessor<double, 1>();
                for (std::int64_t index = 0; index < z.size(0); ++index) {
                    const auto value = access[index];
                    if (!std::isfinite(value)) {
                        throw std::runtime_error("Predictor produced a non-finite output for plan '"
                                                 + chunk[static_cast<std::size_t>(index)]->signature + "'.");
                    }
                    latencies.push_back(normalizer_.denormalize(value));
                }
            }
            return latencies;
        }

        FitReport fit(const std::vector<TrainingExample>& examples, const FitOptions& options)
        {
            const auto minimum = std::max<std::size_t>(options.min_examples, 1);
            if (examples.size() < minimum) {
                throw Error::InsufficientData(examples.size(), minimum);
            }
            if (options.epochs == 0 || options.batch_size == 0) {
                throw std::invalid_argument("fit requires a positive epoch count and batch size.");
            }
            if (options.validation_fraction < 0.0 || options.validation_fraction >= 1.0) {
                throw std::invalid_argument("Validation fraction must be within [0, 1).");
            }
            for (const auto& example : examples) {
                check_compatible(example.encoded);
            }

            FitReport report{};
            report.examples = examples.size();

            std::mt19937_64 generator(options.seed);
            std::vector<std::size_t> order(examples.size());
            std::iota(order.begin(), order.end(), std::size_t{0});
            if (options.shuffle) {
                std::shuffle(order.begin(), order.end(), generator);
            }
            auto validation_count = static_cast<std::size_t>(std::floor(static_cast<double>(examples.size()) * options.validation_fraction));
            validation_count = std::min(validation_count, examples.size() - 1);
            std::vector<std::size_t> train_indices(order.begin(), order.end() - static_cast<std::ptrdiff_t>(validation_count));
            const std::vector<std::size_t> validation_indices(order.end() - static_cast<std::ptrdiff_t>(validation_count), order.end());
            report.train_examples = train_indices.size();
            report.validation_examples = validation_indices.size();

            const bool warm = options.warm_start && freshness_ != Freshness::Untrained;
            if (!warm) {
                seed_ = options.seed;
                initialise();
                std::vector<double> observed;
                observed.reserve(train_indices.size());
                for (const auto index : train_indices) {
                    observed.push_back(examples[index].latency_seconds);
                }
                normalizer_.fit(observed);
            }

            network_->train();
            auto optimizer = Optimizer::build(network_->parameters(), options.optimizer);
            const auto steps_per_epoch = (train_indices.size() + options.batch_size - 1) / options.batch_size;
            std::unique_ptr<LrScheduler::Scheduler> scheduler;
            if (options.scheduler) {
                scheduler = LrScheduler::build(*optimizer, *options.scheduler, options.epochs * steps_per_epoch);
            }

            std::vector<torch::Tensor> best_parameters;
            std::vector<torch::Tensor> best_buffers;
            bool best_state_captured = false;
            std::optional<double> best_loss;
            std::optional<double> previous_loss;

            for (std::size_t epoch = 0; epoch < options.epochs; ++epoch) {
                if (options.cancellation.cancelled()) {
                    report.cancelled = true;
                    break;
                }
                const auto epoch_start = std::chrono::steady_clock::now();
                if (options.shuffle) {
                    std::shuffle(train_indices.begin(), train_indices.end(), generator);
                }

                double loss_sum = 0.0;
                std::size_t seen = 0;
                for (std::size_t offset = 0; offset < train_indices.size(); offset += options.batch_size) {
                    if (options.cancellation.cancelled()) {
                        report.cancelled = true;
                        break;
                    }
                    const auto end = std::min(train_indices.size(), offset + options.batch_size);
                    const std::vector<std::size_t> slice(train_indices.begin() + static_cast<std::ptrdiff_t>(offset),
                                                         train_indices.begin() + static_cast<std::ptrdiff_t>(end));

                    optimizer->zero_grad();
                    auto loss = batch_loss(examples, slice, options.loss);
                    loss.backward();
                    if (options.gradient_clip > 0.0) {
                        torch::nn::utils::clip_grad_norm_(network_->parameters(), options.gradient_clip);
                    }
                    optimizer->step();
                    if (scheduler) {
                        scheduler->step();
                    }
                    loss_sum += loss.item<double>() * static_cast<double>(slice.size());
                    seen += slice.size();
                }
                if (report.cancelled) {
                    break;
                }

                const auto train_loss = loss_sum / static_cast<double>(std::max<std::size_t>(seen, 1));
                std::optional<double> validation_loss;
                if (!validation_indices.empty()) {
                    validation_loss = evaluate_loss(examples, validation_indices, options.loss);
                }

                const auto monitored = validation_loss.value_or(train_loss);
                const bool improved = !best_loss || monitored < *best_loss;
                std::optional<double> delta;
                if (previous_loss) {
                    delta = monitored - *previous_loss;
                }
                previous_loss = monitored;
                if (improved) {
                    best_loss = monitored;
                    if (options.restore_best_state) {
                        capture_state(best_parameters, best_buffers);
                        best_state_captured = true;
                    }
                }

                const auto duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch_start).count();
                report.epochs_completed = epoch + 1;
                report.final_train_loss = train_loss;

                if (options.monitor && options.stream != nullptr) {
                    log_epoch(*options.stream, epoch + 1, options.epochs, train_loss, validation_loss, delta, improved, duration_seconds);
                }
                if (options.on_epoch) {
                    options.on_epoch(EpochReport{
                        .epoch = epoch + 1,
                        .total_epochs = options.epochs,
                        .train_loss = train_loss,
                        .validation_loss = validation_loss,
                        .improved = improved,
                        .learning_rate = scheduler ? scheduler->current_lr() : Optimizer::learning_rate(options.optimizer),
                        .duration_seconds = duration_seconds,
                    });
                }
            }

            if (options.restore_best_state && best_state_captured) {
                if (options.monitor) {
                    Utils::Terminal::Info(options.stream, "[Skuld] Reloading best state of the network...");
                }
                restore_state(best_parameters, best_buffers);
                report.restored_best_state = true;
            }
            if (!validation_indices.empty()) {
                report.best_validation_loss = best_loss;
            }

            network_->eval();
            if (report.epochs_completed > 0) {
                freshness_ = Freshness::Trained;
                example_count_ = examples.size();
                created_at_ = timestamp();
            }
            return report;
        }

        [[nodiscard]] std::string schema_version() const override { return schema_version_; }
        [[nodiscard]] std::int64_t feature_width() const override { return feature_width_; }

        [[nodiscard]] Freshness freshness() const noexcept { return freshness_; }
        [[nodiscard]] std::size_t example_count() const noexcept { return example_count_; }
        [[nodiscard]] const std::string& created_at() const noexcept { return created_at_; }
        [[nodiscard]] const NetworkOptions& options() const noexcept { return options_; }
        [[nodiscard]] const LatencyNormalizer& normalizer() const noexcept { return normalizer_; }
        [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }

        [[nodiscard]] Common::SaveLoad::PropertyTree metadata() const
        {
            Common::SaveLoad::PropertyTree tree;
            tree.put("format_version", kFormatVersion);
            tree.put("schema_version", schema_version_);
            tree.put("feature_width", feature_width_);
            tree.put("example_count", example_count_);
            tree.put("created_at", created_at_);
            tree.put("seed", seed_);
            tree.add_child("network", to_property_tree(options_));
            tree.add_child("normalizer", normalizer_.to_property_tree());
            return tree;
        }

        // libtorch archive bytes, the content of parameters.binary.
        [[nodiscard]] std::string serialize_parameters() const
        {
            torch::serialize::OutputArchive archive;
            network_->save(archive);
            std::ostringstream stream(std::ios::out | std::ios::binary);
            archive.save_to(stream);
            return stream.str();
        }

        // Rebuilds a model from its metadata and parameter bytes. The feature schema is checked
        // before anything else so that an incompatible record never reaches inference.
        static std::unique_ptr<PredictorModel> restore(const Common::SaveLoad::PropertyTree& metadata,
                                                       const std::string& parameters,
                                                       const std::string& context)
        {
            using namespace Common::SaveLoad::Detail;

            const auto expected_schema = Encoding::GraphEncoder::schema_version();
            const auto schema = metadata.get<std::string>("schema_version", "<missing>");
            if (schema != expected_schema) {
                throw Error::SchemaMismatch(context, expected_schema, schema);
            }
            const auto expected_width = static_cast<std::int64_t>(Encoding::kFeatureWidth);
            const auto width = metadata.get<std::int64_t>("feature_width", -1);
            if (width != expected_width) {
                throw Error::SchemaMismatch(context, "feature width " + std::to_string(expected_width),
                                            "feature width " + std::to_string(width));
            }

            try {
                const auto version = get_numeric<int>(metadata, "format_version", context);
                if (version > kFormatVersion) {
                    throw Error::ArtifactCorrupted(context + " uses format version " + std::to_string(version)
                                                   + " which is newer than the supported " + std::to_string(kFormatVersion) + ".");
                }
                auto model = std::make_unique<PredictorModel>(
                    network_options_from(get_child(metadata, "network", context), context),
                    metadata.get<std::uint64_t>("seed", 42));
                model->normalizer_ = LatencyNormalizer::from_property_tree(get_child(metadata, "normalizer", context), context);
                model->example_count_ = get_numeric<std::size_t>(metadata, "example_count", context);
                model->created_at_ = metadata.get<std::string>("created_at", "");
                model->load_parameters(parameters, context);
                model->freshness_ = Freshness::Loaded;
                return model;
            } catch (const Error::ArtifactCorrupted&) {
                throw;
            } catch (const std::exception& error) {
                throw Error::ArtifactCorrupted(context + ": " + error.what());
            }
        }

    private:
        void initialise()
        {
            torch::manual_seed(seed_);
            network_ = LatencyNetwork(feature_width_, options_);
            network_->eval();
            normalizer_ = LatencyNormalizer{};
            freshness_ = Freshness::Untrained;
            example_count_ = 0;
            created_at_.clear();
        }

        void check_compatible(const Encoding::EncodedGraph& encoded) const
        {
            if (encoded.schema_version != schema_version_) {
                throw Error::SchemaMismatch("encoded graph '" + encoded.signature + "'", schema_version_, encoded.schema_version);
            }
            if (encoded.feature_width() != feature_width_) {
                throw Error::SchemaMismatch("encoded graph '" + encoded.signature + "'",
                                            "feature width " + std::to_string(feature_width_),
                                            "feature width " + std::to_string(encoded.feature_width()));
            }
        }

        torch::Tensor batch_loss(const std::vector<TrainingExample>& examples,
                                 const std::vector<std::size_t>& indices,
                                 const Loss::Descriptor& loss)
        {
            std::vector<const Encoding::EncodedGraph*> graphs;
            std::vector<float> normalized;
            std::vector<float> seconds;
            graphs.reserve(indices.size());
            normalized.reserve(indices.size());
            seconds.reserve(indices.size());
            for (const auto index : indices) {
                const auto& example = examples[index];
                graphs.push_back(&example.encoded);
                normalized.push_back(static_cast<float>(normalizer_.normalize(example.latency_seconds)));
                seconds.push_back(static_cast<float>(example.latency_seconds));
            }

            auto prediction = network_->forward(Encoding::collate(graphs));
            const auto count = static_cast<std::int64_t>(indices.size());
            if (Loss::operates_on_latency(loss)) {
                auto target = torch::from_blob(seconds.data(), {count}, torch::kFloat32).clone();
                return std::visit([&](const auto& descriptor) {
                    return Loss::compute(descriptor, normalizer_.denormalize(prediction), target);
                }, loss);
            }
            auto target = torch::from_blob(normalized.data(), {count}, torch::kFloat32).clone();
            return std::visit([&](const auto& descriptor) {
                return Loss::compute(descriptor, prediction, target);
            }, loss);
        }

        double evaluate_loss(const std::vector<TrainingExample>& examples,
                             const std::vector<std::size_t>& indices,
                             const Loss::Descriptor& loss)
        {
            torch::NoGradGuard no_grad;
            network_->eval();
            const auto value = batch_loss(examples, indices, loss).item<double>();
            network_->train();
            return value;
        }

        void capture_state(std::vector<torch::Tensor>& parameters, std::vector<torch::Tensor>& buffers) const
        {
            parameters.clear();
            buffers.clear();
            for (const auto& parameter : network_->parameters()) {
                parameters.push_back(parameter.detach().clone(torch::MemoryFormat::Preserve));
            }
            for (const auto& buffer : network_->buffers()) {
                buffers.push_back(buffer.defined() ? buffer.detach().clone(torch::MemoryFormat::Preserve) : torch::Tensor{});
            }
        }

        void restore_state(const std::vector<torch::Tensor>& parameters, const std::vector<torch::Tensor>& buffers)
        {
            torch::NoGradGuard no_grad;
            auto targets = network_->parameters();
            for (std::size_t index = 0; index < std::min(targets.size(), parameters.size()); ++index) {
                targets[index].copy_(parameters[index]);
            }
            auto buffer_targets = network_->buffers();
            for (std::size_t index = 0; index < std::min(buffer_targets.size(), buffers.size()); ++index) {
                if (buffer_targets[index].defined() && buffers[index].defined()) {
                    buffer_targets[index].copy_(buffers[index]);
                }
            }
        }

        void load_parameters(const std::string& bytes, const std::string& context)
        {
            torch::serialize::InputArchive archive;
            try {
                std::istringstream stream(bytes, std::ios::in | std::ios::binary);
                archive.load_from(stream);
            } catch (const c10::Error& error) {
                throw Error::ArtifactCorrupted("failed to read parameters of " + context + ": " + error.what());
            }

            for (const auto& item : network_->named_parameters(/*recurse=*/true)) {
                validate_entry(archive, item.key(), item.value(), "parameter", context);
            }
            for (const auto& item : network_->named_buffers(/*recurse=*/true)) {
                if (item.value().defined()) {
                    validate_entry(archive, item.key(), item.value(), "buffer", context);
                }
            }

            try {
                network_->load(archive);
            } catch (const c10::Error& error) {
                throw Error::ArtifactCorrupted("failed to load parameters of " + context + ": " + error.what());
            }
            network_->eval();
        }

        static void validate_entry(torch::serialize::InputArchive& archive,
                                   const std::string& key,
                                   const torch::Tensor& expected,
                                   const std::string& kind,
                                   const std::string& context)
        {
            torch::Tensor stored;
            try {
                archive.read(key, stored);
            } catch (const c10::Error& error) {
                throw Error::ArtifactCorrupted(context + " is missing " + kind + " '" + key + "': " + error.what());
            }
            if (!stored.defined()) {
                throw Error::ArtifactCorrupted(context + " " + kind + " '" + key + "' is undefined.");
            }
            if (stored.sizes() != expected.sizes()) {
                throw Error::ArtifactCorrupted(kind + " '" + key + "' shape mismatch in " + context + ": expected "
                                               + format_tensor_shape(expected) + " but found " + format_tensor_shape(stored) + ".");
            }
        }

        static std::string format_tensor_shape(const torch::Tensor& tensor)
        {
            std::ostringstream stream;
            stream << '(';
            const auto sizes = tensor.sizes();
            for (std::size_t index = 0; index < sizes.size(); ++index) {
                if (index > 0) {
                    stream << ", ";
                }
                stream << sizes[index];
            }
            stream << ')';
            return stream.str();
        }

        static std::string timestamp()
        {
            const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc{};
            gmtime_r(&now, &utc);
            std::ostringstream stream;
            stream << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
            return stream.str();
        }

        static void log_epoch(std::ostream& stream,
                              std::size_t epoch_index,
                              std::size_t total_epochs,
                              double train_loss,
                              const std::optional<double>& test_loss,
                              const std::optional<double>& delta,
                              bool improved,
                              double duration_seconds)
        {
            using Utils::Terminal::ApplyColor;
            using Utils::Terminal::Colors::kBrightBlack;
            using Utils::Terminal::Colors::kBrightBlue;
            using Utils::Terminal::Colors::kBrightGreen;
            using Utils::Terminal::Colors::kBrightYellow;
            using Utils::Terminal::Colors::kReset;

            std::ostringstream line;
            line << "Epoch [" << epoch_index << "/" << total_epochs << "] | ";
            line << ApplyColor("Train", kBrightYellow) << " loss: "
                 << std::fixed << std::setprecision(6) << train_loss << " | ";
            line << ApplyColor("Test", kBrightBlue) << " loss: ";
            if (test_loss) {
                line << std::fixed << std::setprecision(6) << *test_loss;
            } else {
                line << "N/A";
            }

            line << " | ΔLoss: ";
            if (delta) {
                std::ostringstream delta_stream;
                delta_stream << std::showpos << std::fixed << std::setprecision(6) << *delta;
                line << delta_stream.str();
            } else {
                line << "N/A";
            }

            const std::string grey{kBrightBlack};
            const std::string green{kBrightGreen};
            const std::string reset{kReset};
            if (improved) {
                line << grey << " (" << green << "∇" << grey << ")" << reset;
            } else {
                line << grey << " (∇)" << reset;
            }

            std::ostringstream duration_stream;
            duration_stream << std::fixed << std::setprecision(2) << duration_seconds << "sec";
            line << " | " << ApplyColor("duration: " + duration_stream.str(), kBrightBlack);

            stream << line.str() << '\n';
        }

        NetworkOptions options_{};
        std::uint64_t seed_{42};
        std::string schema_version_{Encoding::GraphEncoder::schema_version()};
        std::int64_t feature_width_{static_cast<std::int64_t>(Encoding::kFeatureWidth)};
        LatencyNetwork network_{nullptr};
        LatencyNormalizer normalizer_{};
        Freshness freshness_{Freshness::Untrained};
        std::size_t example_count_{0};
        std::string created_at_{};
    };
}

#endif // SKULD_MODEL_PREDICTOR_HPP
