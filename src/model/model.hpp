#ifndef SKULD_MODEL_HPP
#define SKULD_MODEL_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/estimator.hpp"
#include "details/example.hpp"
#include "details/network.hpp"
#include "details/normalizer.hpp"
#include "details/options.hpp"
#include "details/predictor.hpp"

namespace Skuld::Model {
    using NetworkOptions = Details::NetworkOptions;
    using LatencyNetwork = Details::LatencyNetwork;
    using LatencyNormalizer = Details::LatencyNormalizer;
    using ExampleSource = Details::ExampleSource;
    using TrainingExample = Details::TrainingExample;
    using EpochReport = Details::EpochReport;
    using FitOptions = Details::FitOptions;
    using FitReport = Details::FitReport;
    using LatencyEstimator = Details::LatencyEstimator;
    using Freshness = Details::Freshness;
    using PredictorModel = Details::PredictorModel;

    using Details::to_string;
    using Details::to_property_tree;
    using Details::network_options_from;
}

#endif // SKULD_MODEL_HPP
