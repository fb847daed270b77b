#pragma once
#include <random>
#include <variant>
#include <vector>
#include "core/tensor.h"


namespace txl {


struct LinearLike { Tensor weight; Tensor bias; }; // bias may be undefined
struct EmbeddingLike { Tensor weight; };
struct NormLike { Tensor scale; Tensor shift; };

using ParamGroup = std::variant<LinearLike, EmbeddingLike, NormLike>;


// weights ~ N(0, std), biases 0, norm scale 1 / shift 0. Writes through the
// handles, so the owning modules see the new values.
void init_params(const std::vector<ParamGroup>& groups, float std, std::mt19937& rng);

// every tensor of `groups`, in declaration order
std::vector<Tensor> parameters_of(const std::vector<ParamGroup>& groups);


} // namespace txl
