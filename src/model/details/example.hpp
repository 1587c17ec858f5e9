#ifndef SKULD_MODEL_EXAMPLE_HPP
#define SKULD_MODEL_EXAMPLE_HPP

#include <string>

#include "../../encoding/encoding.hpp"
#include "../../plan/plan.hpp"

namespace Skuld::Model::Details {
    enum class ExampleSource {
        Measured,
        Cached,
    };

    inline std::string to_string(ExampleSource source)
    {
        return source == ExampleSource::Measured ? "measured" : "cached";
    }

    struct TrainingExample {
        Plan::ExecutionPlan plan;
        double latency_seconds{0.0};
        ExampleSource source{ExampleSource::Measured};
        Encoding::EncodedGraph encoded{};
    };
}

#endif // SKULD_MODEL_EXAMPLE_HPP
