#pragma once
#include <cstdint>
#include <memory>
#include <random>
#include <vector>
#include "core/tensor.h"


namespace txl {


class IBackend;


// Differentiable host ops on contiguous f32 tensors. Each op records a
// backward node when grad mode is on and an input requires grad.
namespace ops {


// ids: i32 [...], weight: [V, E] -> [..., E]. Throws std::out_of_range for ids outside [0, V).
Tensor embedding(const Tensor& ids, const Tensor& weight);

// x: [..., K], w: [M, K], b: [M] or undefined -> [..., M]
Tensor linear(const std::shared_ptr<IBackend>& be, const Tensor& x, const Tensor& w,
const Tensor& b = Tensor());

Tensor add(const Tensor& a, const Tensor& b);

// normalises over the last axis
Tensor layer_norm(const Tensor& x, const Tensor& gamma, const Tensor& beta, float eps);

// tanh approximation
Tensor gelu(const Tensor& x);

// inverted dropout; identity when !training or p == 0
Tensor dropout(const Tensor& x, float p, bool training, std::mt19937& rng);

// saturates to [lo, hi]; gradient passes where lo <= x <= hi
Tensor clamp(const Tensor& x, float lo, float hi);

// over the last axis
Tensor softmax(IBackend& be, const Tensor& x);

Tensor reshape(const Tensor& x, const std::vector<int64_t>& shape);

// [A, B, ...] -> [B, A, ...]
Tensor transpose01(const Tensor& x);

// concatenation / slicing along axis 0
Tensor concat0(const Tensor& a, const Tensor& b);
Tensor narrow0(const Tensor& x, int64_t start, int64_t length);

// Causal multi-head attention with relative positions, time-major layouts:
// q [T, B, H, D], k/v [mem_len + T, B, H, D], pos [P, H*D], u/r [H, D].
// Query i sees keys j <= mem_len + i; distance mem_len + i - j is clipped to P - 1.
Tensor rel_attention(const Tensor& q, const Tensor& k, const Tensor& v, const Tensor& pos,
const Tensor& u, const Tensor& r, int64_t mem_len,
float dropout_p, bool training, std::mt19937& rng);

// -> [1]
Tensor sum(const Tensor& x);

// logits [..., V], targets i32 with one id per logits row -> mean loss [1]
Tensor cross_entropy(const Tensor& logits, const Tensor& targets);


} // namespace ops
} // namespace txl
