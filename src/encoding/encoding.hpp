#ifndef SKULD_ENCODING_HPP
#define SKULD_ENCODING_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/features.hpp"
#include "details/encoder.hpp"
#include "details/collate.hpp"

namespace Skuld::Encoding {
    inline constexpr std::string_view kSchemaVersion = Details::kSchemaVersion;
    inline constexpr std::size_t kFeatureWidth = Details::kFeatureWidth;

    using AttentionPolicy = Details::AttentionPolicy;
    using EncoderOptions = Details::EncoderOptions;
    using EncodedGraph = Details::EncodedGraph;
    using GraphEncoder = Details::GraphEncoder;
    using Batch = Details::Batch;

    using Details::collate;
}

#endif // SKULD_ENCODING_HPP
