#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>
#include "core/init.h"
#include "core/kv_cache.h"
#include "core/tensor.h"
#include "txlinfer/txlinfer.h"


namespace txl {


class IBackend;


// Pre-norm Transformer-XL block: relative-position self-attention over
// [memory, segment] followed by a GELU feed-forward, both residual.
class DecoderBlock {
public:
DecoderBlock(const ModelConfig& h, std::shared_ptr<IBackend> be);
// x: [B, T, E]. Writes this layer's outgoing keys/values to *present.
Tensor forward(const Tensor& x, const Tensor& pos_emb, const LayerKV* past, int64_t max_cache_length,
bool training, std::mt19937& rng, LayerKV* present) const;
std::vector<ParamGroup> param_groups() const;
private:
Tensor split_heads(const Tensor& x) const; // [B, T, E] -> [T, B, H, D]
Tensor merge_heads(const Tensor& x) const; // [T, B, H, D] -> [B, T, E]

ModelConfig h_;
std::shared_ptr<IBackend> be_;
KVCacheManager kv_;
Tensor ln_att_w_, ln_att_b_, ln_ffn_w_, ln_ffn_b_;
Tensor w_q_, b_q_, w_k_, b_k_, w_v_, b_v_, w_o_, b_o_;
Tensor r_w_bias_, r_r_bias_; // content / position biases, [H, D]
Tensor w_ff1_, b_ff1_, w_ff2_, b_ff2_;
};


class TransformerDecoder {
public:
struct Output {
Tensor hidden; // [B, T, E]
KVCache cache; // still attached to the graph
};

TransformerDecoder(const ModelConfig& h, std::shared_ptr<IBackend> be);
// max_cache_length defaults to n_context.
Output forward(const Tensor& x, const KVCache* past, std::optional<int64_t> max_cache_length,
bool training, std::mt19937& rng) const;
std::vector<ParamGroup> param_groups() const;
private:
ModelConfig h_;
std::shared_ptr<IBackend> be_;
KVCacheManager kv_;
std::vector<DecoderBlock> blocks_;
Tensor pos_emb_; // [n_positional_embedding, E], shared by all layers
Tensor ln_f_w_, ln_f_b_;
};


} // namespace txl
