#ifndef SKULD_MODEL_ESTIMATOR_HPP
#define SKULD_MODEL_ESTIMATOR_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "../../encoding/encoding.hpp"

namespace Skuld::Model::Details {
    // Read-only latency oracle consumed by the search. Implementations must tolerate
    // concurrent calls from several worker threads.
    class LatencyEstimator {
    public:
        virtual ~LatencyEstimator() = default;

        [[nodiscard]] virtual double predict(const Encoding::EncodedGraph& encoded) const = 0;

        [[nodiscard]] virtual std::vector<double> predict_batch(const std::vector<const Encoding::EncodedGraph*>& encoded) const
        {
            std::vector<double> latencies;
            latencies.reserve(encoded.size());
            for (const auto* graph : encoded) {
                latencies.push_back(predict(*graph));
            }
            return latencies;
        }

        [[nodiscard]] virtual std::string schema_version() const { return Encoding::GraphEncoder::schema_version(); }
        [[nodiscard]] virtual std::int64_t feature_width() const { return static_cast<std::int64_t>(Encoding::kFeatureWidth); }
    };
}

#endif // SKULD_MODEL_ESTIMATOR_HPP
