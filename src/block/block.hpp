#ifndef SKULD_BLOCK_HPP
#define SKULD_BLOCK_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/graph_encoder.hpp"

namespace Skuld::Block {
    using LayerNormOptions = Details::LayerNormOptions;
    using EncoderOptions = Details::EncoderOptions;
    using EncoderLayer = Details::EncoderLayer;
    using GraphEncoder = Details::GraphEncoder;
}

#endif // SKULD_BLOCK_HPP
