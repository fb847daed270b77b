#include "core/model_ir.h"
#include "core/ops.h"
#include "backends/backend.h"
#include <stdexcept>
#include <string>


namespace txl {


void ModelConfig::validate() const {
auto positive = [](int v, const char* name) {
if (v <= 0) throw std::invalid_argument(std::string(name) + " must be positive, got " + std::to_string(v));
};
positive(n_layer, "n_layer");
positive(n_embedding, "n_embedding");
positive(n_state_ffn, "n_state_ffn");
positive(n_head, "n_head");
positive(n_context, "n_context");
positive(vocab_size, "vocab_size");
positive(n_positional_embedding, "n_positional_embedding");
if (n_embedding % n_head != 0)
throw std::invalid_argument("n_embedding (" + std::to_string(n_embedding) + ") must be divisible by n_head (" +
std::to_string(n_head) + ")");
auto probability = [](float p, const char* name) {
if (!(p >= 0.f && p < 1.f)) throw std::invalid_argument(std::string(name) + " must be in [0, 1)");
};
probability(dropout_residual, "dropout_residual");
probability(dropout_attention, "dropout_attention");
probability(dropout_embedding, "dropout_embedding");
if (!(initializer_range > 0.f)) throw std::invalid_argument("initializer_range must be positive");
if (!(layer_norm_eps > 0.f)) throw std::invalid_argument("layer_norm_eps must be positive");
}


namespace {
const ModelConfig& checked(const ModelConfig& h){
h.validate();
return h;
}

Tensor param(const std::vector<int64_t>& shape){
Tensor t = Tensor::zeros(shape, DType::F32);
t.set_requires_grad(true);
return t;
}
}


DecoderBlock::DecoderBlock(const ModelConfig& h, std::shared_ptr<IBackend> be)
: h_(checked(h)), be_(std::move(be)), kv_(h_.n_layer, h_.n_head, h_.head_dim())
{
const int64_t E = h_.n_embedding, F = h_.n_state_ffn;
ln_att_w_ = param({E}); ln_att_b_ = param({E});
ln_ffn_w_ = param({E}); ln_ffn_b_ = param({E});
w_q_ = param({E, E}); b_q_ = param({E});
w_k_ = param({E, E}); b_k_ = param({E});
w_v_ = param({E, E}); b_v_ = param({E});
w_o_ = param({E, E}); b_o_ = param({E});
r_w_bias_ = param({h_.n_head, h_.head_dim()});
r_r_bias_ = param({h_.n_head, h_.head_dim()});
w_ff1_ = param({F, E}); b_ff1_ = param({F});
w_ff2_ = param({E, F}); b_ff2_ = param({E});
}


Tensor DecoderBlock::split_heads(const Tensor& x) const {
return ops::reshape(ops::transpose01(x), {x.dim(1), x.dim(0), h_.n_head, h_.head_dim()});
}


Tensor DecoderBlock::merge_heads(const Tensor& x) const {
return ops::transpose01(ops::reshape(x, {x.dim(0), x.dim(1), h_.n_embedding}));
}


Tensor DecoderBlock::forward(const Tensor& x, const Tensor& pos_emb, const LayerKV* past, int64_t max_cache_length,
bool training, std::mt19937& rng, LayerKV* present) const {
const int64_t mem_len = past ? past->k.dim(0) : 0;
const float eps = h_.layer_norm_eps;

Tensor a = ops::layer_norm(x, ln_att_w_, ln_att_b_, eps);
Tensor q = split_heads(ops::linear(be_, a, w_q_, b_q_));
Tensor k = split_heads(ops::linear(be_, a, w_k_, b_k_));
Tensor v = split_heads(ops::linear(be_, a, w_v_, b_v_));
LayerKV context = kv_.extend(past, k, v);
Tensor att = ops::rel_attention(q, context.k, context.v, pos_emb, r_w_bias_, r_r_bias_, mem_len,
h_.dropout_attention, training, rng);
att = ops::linear(be_, merge_heads(att), w_o_, b_o_);
Tensor y = ops::add(x, ops::dropout(att, h_.dropout_residual, training, rng));

Tensor f = ops::layer_norm(y, ln_ffn_w_, ln_ffn_b_, eps);
f = ops::linear(be_, ops::gelu(ops::linear(be_, f, w_ff1_, b_ff1_)), w_ff2_, b_ff2_);
y = ops::add(y, ops::dropout(f, h_.dropout_residual, training, rng));

*present = kv_.truncate(context, max_cache_length);
return y;
}


std::vector<ParamGroup> DecoderBlock::param_groups() const {
return {
NormLike{ln_att_w_, ln_att_b_},
LinearLike{w_q_, b_q_},
LinearLike{w_k_, b_k_},
LinearLike{w_v_, b_v_},
LinearLike{w_o_, b_o_},
EmbeddingLike{r_w_bias_},
EmbeddingLike{r_r_bias_},
NormLike{ln_ffn_w_, ln_ffn_b_},
LinearLike{w_ff1_, b_ff1_},
LinearLike{w_ff2_, b_ff2_},
};
}


TransformerDecoder::TransformerDecoder(const ModelConfig& h, std::shared_ptr<IBackend> be)
: h_(checked(h)), be_(std::move(be)), kv_(h_.n_layer, h_.n_head, h_.head_dim())
{
blocks_.reserve(h_.n_layer);
for(int i=0;i<h_.n_layer;++i) blocks_.emplace_back(h_, be_);
pos_emb_ = param({(int64_t)h_.n_positional_embedding, (int64_t)h_.n_embedding});
ln_f_w_ = param({(int64_t)h_.n_embedding});
ln_f_b_ = param({(int64_t)h_.n_embedding});
}


TransformerDecoder::Output TransformerDecoder::forward(const Tensor& x, const KVCache* past,
std::optional<int64_t> max_cache_length, bool training, std::mt19937& rng) const {
if (x.ndim() != 3 || x.dim(2) != h_.n_embedding)
throw std::invalid_argument("decoder input must be [batch, seq, " + std::to_string(h_.n_embedding) +
"], got " + x.shape_str());
const int64_t max_len = max_cache_length.value_or(h_.n_context);
if (max_len <= 0)
throw std::invalid_argument("max cache length must be positive, got " + std::to_string(max_len));
if (past) kv_.validate(*past, x.dim(0));

Output out;
out.cache.layers.resize(blocks_.size());
Tensor y = x;
for (size_t i = 0; i < blocks_.size(); ++i)
y = blocks_[i].forward(y, pos_emb_, past ? &past->layers[i] : nullptr, max_len, training, rng,
&out.cache.layers[i]);
out.hidden = ops::layer_norm(y, ln_f_w_, ln_f_b_, h_.layer_norm_eps);
return out;
}


std::vector<ParamGroup> TransformerDecoder::param_groups() const {
std::vector<ParamGroup> groups{EmbeddingLike{pos_emb_}};
for (const auto& blk : blocks_) {
auto g = blk.param_groups();
groups.insert(groups.end(), g.begin(), g.end());
}
groups.push_back(NormLike{ln_f_w_, ln_f_b_});
return groups;
}


} // namespace txl
