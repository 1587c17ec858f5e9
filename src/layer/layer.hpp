#ifndef SKULD_LAYER_HPP
#define SKULD_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/positional_encoding.hpp"

namespace Skuld::Layer {
    using PositionalEncodingType = Details::PositionalEncodingType;
    using PositionalEncodingOptions = Details::PositionalEncodingOptions;
    using DepthEncoding = Details::DepthEncoding;

    using Details::to_string;
    using Details::parse_positional_encoding;
}

#endif // SKULD_LAYER_HPP
