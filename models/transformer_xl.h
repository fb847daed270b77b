#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>
#include "core/kv_cache.h"
#include "core/model_ir.h"
#include "core/tensor.h"
#include "txlinfer/txlinfer.h"


namespace txl {


class IBackend;


struct ForwardOutput {
Tensor logits; // [B, T, V], clamped to +/-kClampExp
Tensor probs;  // [B, T, V]
Tensor preds;  // i32 [B, T]
KVCache cache; // detached, safe to feed into the next call
};


// Embedding -> recurrent decoder stack -> tied de-embedding. The model keeps
// no per-stream state: the cache goes in and comes back out of forward().
class TransformerXL {
public:
static constexpr float kClampExp = 15.f;

TransformerXL(const ModelConfig& cfg, std::shared_ptr<IBackend> be);

// ids: i32 [batch, seq]. `cache` must come from a previous call with the same
// batch; `max_cache_length` overrides n_context for this call only.
ForwardOutput forward(const Tensor& ids, const std::optional<KVCache>& cache = std::nullopt,
std::optional<int64_t> max_cache_length = std::nullopt);

// row lookup into the shared matrix
Tensor embed(const Tensor& ids) const;
// hidden @ shared^T, no bias
Tensor project(const Tensor& hidden) const;

void init_weights();
void train(bool on = true) { training_ = on; }
void eval() { training_ = false; }
bool is_training() const { return training_; }

std::vector<Tensor> parameters() const;
int64_t num_parameters() const;
// Both roles return the same handle.
const Tensor& embedding_weight() const { return word_embedding_; }
const Tensor& decoding_weight() const { return word_embedding_; }
const ModelConfig& config() const { return h_; }

private:
std::vector<ParamGroup> param_groups() const;

ModelConfig h_;
std::shared_ptr<IBackend> be_;
TransformerDecoder decoder_;
Tensor word_embedding_; // [vocab_size, n_embedding]
std::mt19937 rng_;
bool training_ {true};
};


} // namespace txl
