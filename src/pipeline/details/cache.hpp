#ifndef SKULD_PIPELINE_CACHE_HPP
#define SKULD_PIPELINE_CACHE_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "../../common/save_load.hpp"
#include "measurer.hpp"

namespace Skuld::Pipeline::Details {
    inline constexpr const char* kMeasurementsFile = "measurements.json";

    // Replay set of earlier measurements keyed by plan signature. Plans that exhausted their
    // retry budget are remembered as excluded so later runs do not measure them again.
    class MeasurementCache {
    public:
        [[nodiscard]] std::optional<double> latency(const std::string& signature) const
        {
            const auto found = latencies_.find(signature);
            if (found == latencies_.end()) {
                return std::nullopt;
            }
            return found->second;
        }

        [[nodiscard]] std::optional<FailureReason> exclusion(const std::string& signature) const
        {
            const auto found = excluded_.find(signature);
            if (found == excluded_.end()) {
                return std::nullopt;
            }
            return found->second;
        }

        void record(const std::string& signature, double latency_seconds)
        {
            latencies_[signature] = latency_seconds;
            excluded_.erase(signature);
        }

        void exclude(const std::string& signature, FailureReason reason)
        {
            if (!latencies_.contains(signature)) {
                excluded_[signature] = reason;
            }
        }

        [[nodiscard]] std::size_t size() const noexcept { return latencies_.size(); }
        [[nodiscard]] std::size_t excluded() const noexcept { return excluded_.size(); }

        [[nodiscard]] Common::SaveLoad::PropertyTree to_property_tree() const
        {
            Common::SaveLoad::PropertyTree tree;
            Common::SaveLoad::PropertyTree measurements;
            for (const auto& [signature, latency] : latencies_) {
                Common::SaveLoad::PropertyTree entry;
                entry.put("signature", signature);
                entry.put("latency_seconds", latency);
                measurements.push_back({"", entry});
            }
            Common::SaveLoad::PropertyTree exclusions;
            for (const auto& [signature, reason] : excluded_) {
                Common::SaveLoad::PropertyTree entry;
                entry.put("signature", signature);
                entry.put("reason", to_string(reason));
                exclusions.push_back({"", entry});
            }
            tree.add_child("measurements", measurements);
            tree.add_child("excluded", exclusions);
            return tree;
        }

        static MeasurementCache from_property_tree(const Common::SaveLoad::PropertyTree& tree, const std::string& context)
        {
            using namespace Common::SaveLoad::Detail;
            MeasurementCache cache;
            if (const auto measurements = tree.get_child_optional("measurements")) {
                for (const auto& [name, entry] : *measurements) {
                    const auto signature = get_string(entry, "signature", context);
                    const auto latency = get_numeric<double>(entry, "latency_seconds", context);
                    if (is_valid_latency(latency)) {
                        cache.record(signature, latency);
                    } else {
                        cache.exclude(signature, FailureReason::Error);
                    }
                }
            }
            if (const auto exclusions = tree.get_child_optional("excluded")) {
                for (const auto& [name, entry] : *exclusions) {
                    cache.exclude(get_string(entry, "signature", context), parse_failure_reason(get_string(entry, "reason", context)));
                }
            }
            return cache;
        }

    private:
        std::map<std::string, double> latencies_{};
        std::map<std::string, FailureReason> excluded_{};
    };
}

#endif // SKULD_PIPELINE_CACHE_HPP
