#ifndef SKULD_GRAPH_HPP
#define SKULD_GRAPH_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/plan_graph.hpp"
#include "details/builder.hpp"

namespace Skuld::Graph {
    using NodeKind = Details::NodeKind;
    using Collective = Details::Collective;
    using GraphNode = Details::GraphNode;
    using GraphEdge = Details::GraphEdge;
    using PlanGraph = Details::PlanGraph;

    inline constexpr std::size_t kNodeKindCount = Details::kNodeKindCount;
    inline constexpr std::size_t kCollectiveCount = Details::kCollectiveCount;

    using Details::to_string;
    using Details::build;
    using Details::communication_volume;
}

#endif // SKULD_GRAPH_HPP
