#ifndef SKULD_PIPELINE_CORPUS_HPP
#define SKULD_PIPELINE_CORPUS_HPP

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "../../common/save_load.hpp"
#include "../../model/model.hpp"
#include "../../plan/plan.hpp"
#include "measurer.hpp"

namespace Skuld::Pipeline::Details {
    inline constexpr const char* kCorpusFile = "corpus.json";

    struct CorpusEntry {
        Plan::ExecutionPlan plan{};
        double latency_seconds{0.0};
        Model::ExampleSource source{Model::ExampleSource::Measured};
    };

    // (plan, latency) pairs collected for one key, accumulated across runs and deduplicated by
    // plan signature. The first observation of a plan wins.
    class Corpus {
    public:
        bool add(const Plan::ExecutionPlan& plan, double latency_seconds, Model::ExampleSource source)
        {
            if (!signatures_.insert(plan.signature()).second) {
                return false;
            }
            entries_.push_back({plan, latency_seconds, source});
            return true;
        }

        [[nodiscard]] bool contains(const std::string& signature) const { return signatures_.contains(signature); }
        [[nodiscard]] const std::vector<CorpusEntry>& entries() const noexcept { return entries_; }
        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        void clear()
        {
            entries_.clear();
            signatures_.clear();
        }

        [[nodiscard]] Common::SaveLoad::PropertyTree to_property_tree() const
        {
            Common::SaveLoad::PropertyTree examples;
            for (const auto& entry : entries_) {
                Common::SaveLoad::PropertyTree node;
                node.add_child("plan", Plan::to_property_tree(entry.plan));
                node.put("latency_seconds", entry.latency_seconds);
                node.put("source", Model::to_string(entry.source));
                examples.push_back({"", node});
            }
            Common::SaveLoad::PropertyTree tree;
            tree.add_child("examples", examples);
            return tree;
        }

        static Corpus from_property_tree(const Common::SaveLoad::PropertyTree& tree, const std::string& context)
        {
            using namespace Common::SaveLoad::Detail;
            Corpus corpus;
            if (const auto examples = tree.get_child_optional("examples")) {
                for (const auto& [name, node] : *examples) {
                    const auto source = get_string(node, "source", context) == "cached" ? Model::ExampleSource::Cached
                                                                                       : Model::ExampleSource::Measured;
                    const auto latency = get_numeric<double>(node, "latency_seconds", context);
                    if (!is_valid_latency(latency)) {
                        continue;
                    }
                    corpus.add(Plan::plan_from_property_tree(get_child(node, "plan", context), context), latency, source);
                }
            }
            return corpus;
        }

    private:
        std::vector<CorpusEntry> entries_{};
        std::unordered_set<std::string> signatures_{};
    };
}

#endif // SKULD_PIPELINE_CORPUS_HPP
