#ifndef SKULD_ATTENTION_HPP
#define SKULD_ATTENTION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/kernel.hpp"
#include "details/head.hpp"

namespace Skuld::Attention {
    using MultiHeadOptions = Details::MultiHeadOptions;
    using ScaledDotProductKernel = Details::ScaledDotProductKernel;
    using MultiHeadAttention = Details::MultiHeadAttention;
}

#endif // SKULD_ATTENTION_HPP
