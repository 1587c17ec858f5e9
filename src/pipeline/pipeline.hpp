#ifndef SKULD_PIPELINE_HPP
#define SKULD_PIPELINE_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/measurer.hpp"
#include "details/retry.hpp"
#include "details/cache.hpp"
#include "details/corpus.hpp"
#include "details/sampling.hpp"
#include "details/training.hpp"

namespace Skuld::Pipeline {
    using FailureReason = Details::FailureReason;
    using MeasurementResult = Details::MeasurementResult;
    using Measurer = Details::Measurer;
    using RetryPolicy = Details::RetryPolicy;
    using MeasurementOutcome = Details::MeasurementOutcome;
    using MeasurementCache = Details::MeasurementCache;
    using CorpusEntry = Details::CorpusEntry;
    using Corpus = Details::Corpus;
    using StageInterval = Details::StageInterval;
    using IntervalSampling = Details::IntervalSampling;
    using TrainingPlanOptions = Details::TrainingPlanOptions;
    using ReuseMode = Details::ReuseMode;
    using PipelineOptions = Details::PipelineOptions;
    using TrainingOutcome = Details::TrainingOutcome;
    using TrainingPipeline = Details::TrainingPipeline;

    using Details::kMeasurementsFile;
    using Details::kCorpusFile;
    using Details::to_string;
    using Details::parse_failure_reason;
    using Details::parse_reuse_mode;
    using Details::is_transient;
    using Details::is_valid_latency;
    using Details::measure_once;
    using Details::measure_with_retry;
    using Details::sample_stage_intervals;
    using Details::generate_training_plans;
}

#endif // SKULD_PIPELINE_HPP
