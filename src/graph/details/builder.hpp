#ifndef SKULD_GRAPH_BUILDER_HPP
#define SKULD_GRAPH_BUILDER_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../../plan/plan.hpp"
#include "plan_graph.hpp"

namespace Skuld::Graph::Details {
    namespace Cost {
        // One ring pass: reduce-scatter or all-gather of `bytes`.
        inline double ring_pass(double bytes, std::int64_t participants, double bandwidth)
        {
            if (participants <= 1 || bandwidth <= 0.0) {
                return 0.0;
            }
            const auto n = static_cast<double>(participants);
            return (n - 1.0) / n * bytes / bandwidth;
        }

        inline double ring_all_reduce(double bytes, std::int64_t participants, double bandwidth)
        {
            return 2.0 * ring_pass(bytes, participants, bandwidth);
        }

        inline double all_to_all(double bytes, std::int64_t participants, double bandwidth)
        {
            if (participants <= 1 || bandwidth <= 0.0) {
                return 0.0;
            }
            const auto n = static_cast<double>(participants);
            return (n - 1.0) / n * bytes / bandwidth;
        }

        inline double point_to_point(double bytes, double bandwidth)
        {
            return bandwidth <= 0.0 ? 0.0 : bytes / bandwidth;
        }
    }

    // Emits one stage worth of nodes and tracks the running per-micro-batch stage time.
    class StageEmitter {
    public:
        StageEmitter(PlanGraph& graph, const Plan::ExecutionPlan& plan, const Plan::ModelSpec& spec,
                     const Plan::HardwareProfile& hardware, std::size_t stage_index)
            : graph_(graph),
              plan_(plan),
              spec_(spec),
              hardware_(hardware),
              stage_index_(stage_index),
              stage_(plan.stages()[stage_index]) {}

        std::size_t emit(std::size_t predecessor, double incoming_bytes)
        {
            tail_ = predecessor;
            tail_bytes_ = incoming_bytes;
            for (auto layer = stage_.first_layer; layer <= stage_.last_layer; ++layer) {
                for (const auto& op : spec_.layers[layer].operators) {
                    emit_operator(layer, op);
                }
            }
            return tail_;
        }

        [[nodiscard]] double elapsed() const noexcept { return elapsed_; }
        [[nodiscard]] double parameter_bytes() const noexcept { return parameter_bytes_; }
        [[nodiscard]] double tail_activation_bytes() const noexcept { return tail_bytes_; }

    private:
        [[nodiscard]] double micro_batch_bytes(double bytes) const
        {
            return bytes / static_cast<double>(plan_.micro_batches()) / static_cast<double>(stage_.degrees.data);
        }

        // Tensor groups never cross hosts because the tensor degree divides the host width.
        [[nodiscard]] double tensor_bandwidth() const noexcept { return hardware_.intra_host_bandwidth; }

        [[nodiscard]] double stage_bandwidth() const noexcept
        {
            return stage_.submesh.hosts > 1 ? hardware_.inter_host_bandwidth : hardware_.intra_host_bandwidth;
        }

        std::size_t append(GraphNode node, double edge_bytes, Collective edge_collective)
        {
            const auto index = graph_.add_node(std::move(node));
            graph_.add_edge(tail_, index, edge_bytes, edge_collective);
            tail_ = index;
            return index;
        }

        void emit_communication(Collective collective, const std::string& label, double bytes, double cost,
                                const std::vector<std::int64_t>& shape)
        {
            GraphNode node{};
            node.kind = NodeKind::Communication;
            node.shape = shape;
            node.degrees = stage_.degrees;
            node.stage = stage_index_;
            node.compute_cost = cost;
            node.volume_bytes = bytes;
            node.collective = collective;
            node.label = label;
            append(std::move(node), bytes, collective);
            elapsed_ += cost;
        }

        void emit_operator(std::size_t layer, const Plan::OperatorSpec& op)
        {
            const auto shards = static_cast<double>(stage_.degrees.data * stage_.degrees.tensor);
            const auto devices = stage_.submesh.size();
            const auto prefix = "s" + std::to_string(stage_index_) + ".l" + std::to_string(layer) + ".";

            if (op.type == Plan::OpType::ExpertUp && devices > 1) {
                const auto bytes = micro_batch_bytes(tail_bytes_);
                emit_communication(Collective::AllToAll, prefix + "dispatch", bytes,
                                   Cost::all_to_all(bytes, devices, stage_bandwidth()), op.shape);
            }

            GraphNode node{};
            node.kind = NodeKind::Compute;
            node.op = op.type;
            node.shape = op.shape;
            node.degrees = stage_.degrees;
            node.stage = stage_index_;
            node.compute_cost = op.flops / static_cast<double>(plan_.micro_batches()) / shards / hardware_.device_flops;
            node.label = prefix + Plan::to_string(op.type);
            append(std::move(node), micro_batch_bytes(tail_bytes_), Collective::None);
            elapsed_ += graph_.node(tail_).compute_cost;
            tail_bytes_ = op.activation_bytes;
            parameter_bytes_ += op.parameter_bytes;

            const bool reduces_tensor_shards = op.type == Plan::OpType::AttentionOutput
                || op.type == Plan::OpType::MlpDown
                || op.type == Plan::OpType::ExpertDown;
            if (reduces_tensor_shards && stage_.degrees.tensor > 1) {
                const auto bytes = micro_batch_bytes(op.activation_bytes);
                emit_communication(Collective::AllReduce, prefix + "tensor_all_reduce", bytes,
                                   Cost::ring_all_reduce(bytes, stage_.degrees.tensor, tensor_bandwidth()), op.shape);
            }
            if (op.type == Plan::OpType::ExpertDown && devices > 1) {
                const auto bytes = micro_batch_bytes(op.activation_bytes);
                emit_communication(Collective::AllToAll, prefix + "combine", bytes,
                                   Cost::all_to_all(bytes, devices, stage_bandwidth()), op.shape);
            }
        }

        PlanGraph& graph_;
        const Plan::ExecutionPlan& plan_;
        const Plan::ModelSpec& spec_;
        const Plan::HardwareProfile& hardware_;
        std::size_t stage_index_;
        const Plan::StageAssignment& stage_;
        std::size_t tail_{0};
        double tail_bytes_{0.0};
        double elapsed_{0.0};
        double parameter_bytes_{0.0};
    };

    [[nodiscard]] inline bool same_host(const Plan::DeviceMesh& mesh, const Plan::StageAssignment& left,
                                        const Plan::StageAssignment& right) noexcept
    {
        const auto last_left = left.device_offset + left.submesh.size() - 1;
        const auto last_right = right.device_offset + right.submesh.size() - 1;
        const auto host = left.device_offset / mesh.devices_per_host;
        return host == last_left / mesh.devices_per_host
            && host == right.device_offset / mesh.devices_per_host
            && host == last_right / mesh.devices_per_host;
    }

    // Validates the plan, then lowers it to a DAG ordered stage -> layer -> operator.
    // Throws Error::InvalidPlan for infeasible plans.
    inline PlanGraph build(const Plan::ExecutionPlan& plan, const Plan::ModelSpec& spec,
                           const Plan::HardwareProfile& hardware = {})
    {
        Plan::validate(plan, spec);

        PlanGraph graph(plan.signature(), plan.stage_count());
        const auto& mesh = plan.mesh();
        const std::vector<std::int64_t> tokens{spec.global_batch_size, spec.sequence_length, spec.hidden_size};

        GraphNode input{};
        input.kind = NodeKind::Input;
        input.shape = tokens;
        input.degrees = plan.stages().front().degrees;
        input.stage = 0;
        input.label = "input";
        auto tail = graph.add_node(std::move(input));

        std::vector<double> stage_times;
        std::vector<std::size_t> gradient_syncs;
        double longest_sync = 0.0;
        double tail_bytes = static_cast<double>(spec.global_batch_size * spec.sequence_length * spec.hidden_size)
                          * static_cast<double>(spec.bytes_per_element);

        for (std::size_t index = 0; index < plan.stage_count(); ++index) {
            const auto& stage = plan.stages()[index];

            if (index > 0) {
                const auto& previous = plan.stages()[index - 1];
                const auto bytes = tail_bytes / static_cast<double>(plan.micro_batches());
                const auto bandwidth = same_host(mesh, previous, stage) ? hardware.intra_host_bandwidth
                                                                        : hardware.inter_host_bandwidth;
                GraphNode transfer{};
                transfer.kind = NodeKind::Communication;
                transfer.shape = tokens;
                transfer.degrees = stage.degrees;
                transfer.stage = index;
                transfer.compute_cost = Cost::point_to_point(bytes, bandwidth);
                transfer.volume_bytes = bytes;
                transfer.collective = Collective::SendRecv;
                transfer.label = "s" + std::to_string(index - 1) + "->s" + std::to_string(index);
                const auto node = graph.add_node(std::move(transfer));
                graph.add_edge(tail, node, bytes, Collective::SendRecv);
                stage_times.back() += graph.node(node).compute_cost;
                tail = node;
            }

            StageEmitter emitter(graph, plan, spec, hardware, index);
            tail = emitter.emit(tail, tail_bytes);
            stage_times.push_back(emitter.elapsed());
            tail_bytes = emitter.tail_activation_bytes();

            if (stage.degrees.data > 1) {
                const auto bytes = emitter.parameter_bytes() / static_cast<double>(stage.degrees.tensor);
                const auto bandwidth = stage.submesh.hosts > 1 ? hardware.inter_host_bandwidth
                                                               : hardware.intra_host_bandwidth;
                const auto prefix = "s" + std::to_string(index) + ".gradient_";
                auto sync_tail = tail;
                double sync_time = 0.0;
                const auto emit_sync = [&](Collective collective, const std::string& label, double cost) {
                    GraphNode sync{};
                    sync.kind = NodeKind::Communication;
                    sync.shape = {static_cast<std::int64_t>(bytes)};
                    sync.degrees = stage.degrees;
                    sync.stage = index;
                    sync.compute_cost = cost;
                    sync.volume_bytes = bytes;
                    sync.collective = collective;
                    sync.label = prefix + label;
                    const auto node = graph.add_node(std::move(sync));
                    graph.add_edge(sync_tail, node, bytes, collective);
                    sync_tail = node;
                    sync_time += cost;
                };
                if (hardware.prefer_reduce_scatter) {
                    emit_sync(Collective::ReduceScatter, "reduce_scatter", Cost::ring_pass(bytes, stage.degrees.data, bandwidth));
                    emit_sync(Collective::AllGather, "all_gather", Cost::ring_pass(bytes, stage.degrees.data, bandwidth));
                } else {
                    emit_sync(Collective::AllReduce, "all_reduce", Cost::ring_all_reduce(bytes, stage.degrees.data, bandwidth));
                }
                longest_sync = std::max(longest_sync, sync_time);
                gradient_syncs.push_back(sync_tail);
            }
        }

        const auto slowest = *std::max_element(stage_times.begin(), stage_times.end());
        double total = 0.0;
        for (const auto time : stage_times) {
            total += time;
        }

        GraphNode completion{};
        completion.kind = NodeKind::Completion;
        completion.shape = {plan.micro_batches(), static_cast<std::int64_t>(plan.stage_count())};
        completion.degrees = plan.stages().back().degrees;
        completion.stage = plan.stage_count() - 1;
        completion.compute_cost = slowest * static_cast<double>(plan.micro_batches() - 1) + total + longest_sync;
        completion.label = "completion";
        const auto root = graph.add_node(std::move(completion));

        graph.add_edge(tail, root);
        for (const auto sync : gradient_syncs) {
            graph.add_edge(sync, root);
        }
        return graph;
    }

    // Structural tie-breaker used by the search.
    inline double communication_volume(const Plan::ExecutionPlan& plan, const Plan::ModelSpec& spec,
                                       const Plan::HardwareProfile& hardware = {})
    {
        return build(plan, spec, hardware).total_communication_volume();
    }
}

#endif // SKULD_GRAPH_BUILDER_HPP
