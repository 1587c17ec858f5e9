#ifndef SKULD_PLAN_HPP
#define SKULD_PLAN_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/types.hpp"
#include "details/model_spec.hpp"
#include "details/hardware.hpp"
#include "details/validate.hpp"
#include "details/serialize.hpp"
#include "details/enumerate.hpp"

namespace Skuld::Plan {
    using DeviceMesh = Details::DeviceMesh;
    using SubmeshShape = Details::SubmeshShape;
    using ParallelDegrees = Details::ParallelDegrees;
    using StageAssignment = Details::StageAssignment;
    using ExecutionPlan = Details::ExecutionPlan;

    using Benchmark = Details::Benchmark;
    using OpType = Details::OpType;
    using OperatorSpec = Details::OperatorSpec;
    using LayerSpec = Details::LayerSpec;
    using ModelSpec = Details::ModelSpec;
    using ModelPreset = Details::ModelPreset;
    using HardwareProfile = Details::HardwareProfile;
    using Placement = Details::Placement;

    using Details::to_string;
    using Details::parse_benchmark;
    using Details::make_model_spec;
    using Details::moe_1_3b_preset;
    using Details::gpt_1_3b_preset;
    using Details::moe_1_3b;
    using Details::gpt_1_3b;
    using Details::default_model;
    using Details::hardware_signature;
    using Details::admissible_submesh;
    using Details::admissible_submeshes;
    using Details::aligned_placement;
    using Details::validate;
    using Details::is_feasible;
    using Details::to_property_tree;
    using Details::plan_from_property_tree;
    using Details::mesh_splits;
    using Details::logical_shapes;
    using Details::micro_batch_choices;
}

#endif // SKULD_PLAN_HPP
