#ifndef SKULD_GRAPH_PLAN_GRAPH_HPP
#define SKULD_GRAPH_PLAN_GRAPH_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../plan/plan.hpp"

namespace Skuld::Graph::Details {
    enum class NodeKind {
        Input,
        Compute,
        Communication,
        Completion,
    };
    inline constexpr std::size_t kNodeKindCount = 4;

    enum class Collective {
        None,
        AllReduce,
        AllGather,
        ReduceScatter,
        AllToAll,
        SendRecv,
    };
    inline constexpr std::size_t kCollectiveCount = 6;

    inline std::string to_string(NodeKind kind)
    {
        switch (kind) {
            case NodeKind::Input:         return "input";
            case NodeKind::Compute:       return "compute";
            case NodeKind::Communication: return "communication";
            case NodeKind::Completion:    return "completion";
        }
        return "unknown";
    }

    inline std::string to_string(Collective collective)
    {
        switch (collective) {
            case Collective::None:          return "none";
            case Collective::AllReduce:     return "all_reduce";
            case Collective::AllGather:     return "all_gather";
            case Collective::ReduceScatter: return "reduce_scatter";
            case Collective::AllToAll:      return "all_to_all";
            case Collective::SendRecv:      return "send_recv";
        }
        return "unknown";
    }

    struct GraphNode {
        NodeKind kind{NodeKind::Compute};
        std::optional<Plan::OpType> op{};       // set for compute nodes only
        std::vector<std::int64_t> shape{};
        Plan::ParallelDegrees degrees{};
        std::size_t stage{0};
        double compute_cost{0.0};                // seconds per micro-batch, structural estimate
        double volume_bytes{0.0};                // bytes moved by a communication node
        Collective collective{Collective::None};
        std::string label{};
        std::vector<std::size_t> inputs{};
        std::vector<std::size_t> outputs{};
    };

    struct GraphEdge {
        std::size_t source{std::numeric_limits<std::size_t>::max()};
        std::size_t target{std::numeric_limits<std::size_t>::max()};
        double volume_bytes{0.0};
        Collective collective{Collective::None};
    };

    class PlanGraph {
    public:
        PlanGraph() = default;
        PlanGraph(std::string signature, std::size_t stage_count)
            : signature_(std::move(signature)), stage_count_(stage_count) {}

        std::size_t add_node(GraphNode node)
        {
            node.inputs.clear();
            node.outputs.clear();
            nodes_.push_back(std::move(node));
            return nodes_.size() - 1;
        }

        void add_edge(std::size_t source, std::size_t target, double volume_bytes = 0.0,
                      Collective collective = Collective::None)
        {
            if (source >= nodes_.size() || target >= nodes_.size()) {
                throw std::out_of_range("Plan graph edge references node " + std::to_string(std::max(source, target))
                                        + " but the graph has " + std::to_string(nodes_.size()) + " nodes.");
            }
            nodes_[source].outputs.push_back(target);
            nodes_[target].inputs.push_back(source);
            edges_.push_back(GraphEdge{source, target, volume_bytes, collective});
        }

        [[nodiscard]] const std::vector<GraphNode>& nodes() const noexcept { return nodes_; }
        [[nodiscard]] const std::vector<GraphEdge>& edges() const noexcept { return edges_; }
        [[nodiscard]] const GraphNode& node(std::size_t index) const { return nodes_.at(index); }
        [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
        [[nodiscard]] std::size_t stage_count() const noexcept { return stage_count_; }
        [[nodiscard]] const std::string& signature() const noexcept { return signature_; }

        [[nodiscard]] std::optional<std::size_t> root() const noexcept
        {
            for (std::size_t index = 0; index < nodes_.size(); ++index) {
                if (nodes_[index].kind == NodeKind::Completion) {
                    return index;
                }
            }
            return std::nullopt;
        }

        [[nodiscard]] double total_communication_volume() const noexcept
        {
            double total = 0.0;
            for (const auto& node : nodes_) {
                if (node.kind == NodeKind::Communication) {
                    total += node.volume_bytes;
                }
            }
            return total;
        }

        // Kahn's algorithm; among ready nodes the smallest insertion id goes first.
        [[nodiscard]] std::vector<std::size_t> topological_order() const
        {
            std::vector<std::size_t> indegree(nodes_.size(), 0);
            for (const auto& node : nodes_) {
                for (const auto target : node.outputs) {
                    ++indegree[target];
                }
            }
            std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
            for (std::size_t index = 0; index < nodes_.size(); ++index) {
                if (indegree[index] == 0) {
                    ready.push(index);
                }
            }

            std::vector<std::size_t> order;
            order.reserve(nodes_.size());
            while (!ready.empty()) {
                const auto index = ready.top();
                ready.pop();
                order.push_back(index);
                for (const auto target : nodes_[index].outputs) {
                    if (--indegree[target] == 0) {
                        ready.push(target);
                    }
                }
            }
            if (order.size() != nodes_.size()) {
                throw std::logic_error("Plan graph '" + signature_ + "' contains a cycle.");
            }
            return order;
        }

        // Acyclic, a single sink which is the completion root, every node reachable from an input.
        void validate() const
        {
            if (nodes_.empty()) {
                throw std::logic_error("Plan graph '" + signature_ + "' is empty.");
            }
            const auto order = topological_order();

            std::optional<std::size_t> sink{};
            for (std::size_t index = 0; index < nodes_.size(); ++index) {
                if (!nodes_[index].outputs.empty()) {
                    continue;
                }
                if (sink) {
                    throw std::logic_error("Plan graph '" + signature_ + "' has more than one sink ('"
                                           + nodes_[*sink].label + "', '" + nodes_[index].label + "').");
                }
                sink = index;
            }
            if (!sink || nodes_[*sink].kind != NodeKind::Completion) {
                throw std::logic_error("Plan graph '" + signature_ + "' does not end in a completion node.");
            }

            std::vector<bool> reachable(nodes_.size(), false);
            for (const auto index : order) {
                if (nodes_[index].kind == NodeKind::Input) {
                    reachable[index] = true;
                }
                if (!reachable[index]) {
                    throw std::logic_error("Plan graph node '" + nodes_[index].label + "' is unreachable from any input.");
                }
                for (const auto target : nodes_[index].outputs) {
                    reachable[target] = true;
                }
            }
        }

    private:
        std::string signature_{};
        std::size_t stage_count_{0};
        std::vector<GraphNode> nodes_{};
        std::vector<GraphEdge> edges_{};
    };
}

#endif // SKULD_GRAPH_PLAN_GRAPH_HPP
