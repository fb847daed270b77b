#include "models/transformer_xl.h"
#include "models/sampler.h"
#include "core/ops.h"
#include "backends/backend.h"
#include <glog/logging.h>
#include <stdexcept>


namespace txl {


TransformerXL::TransformerXL(const ModelConfig& cfg, std::shared_ptr<IBackend> be)
: h_(cfg), be_(std::move(be)), decoder_(h_, be_), rng_(cfg.seed)
{
if (!be_) throw std::invalid_argument("TransformerXL: null backend");
word_embedding_ = Tensor::zeros({(int64_t)h_.vocab_size, (int64_t)h_.n_embedding}, DType::F32);
word_embedding_.set_requires_grad(true);
init_weights();
LOG(INFO) << "TransformerXL: n_layer=" << h_.n_layer << " n_embedding=" << h_.n_embedding
<< " n_head=" << h_.n_head << " n_context=" << h_.n_context << " vocab_size=" << h_.vocab_size
<< " parameters=" << num_parameters();
}


Tensor TransformerXL::embed(const Tensor& ids) const {
return ops::embedding(ids, word_embedding_);
}


Tensor TransformerXL::project(const Tensor& hidden) const {
return ops::linear(be_, hidden, word_embedding_);
}


ForwardOutput TransformerXL::forward(const Tensor& ids, const std::optional<KVCache>& cache,
std::optional<int64_t> max_cache_length){
if (!ids.defined() || ids.desc().dtype != DType::I32 || ids.ndim() != 2)
throw std::invalid_argument("TransformerXL: ids must be an i32 [batch, seq] tensor");
const int64_t B = ids.dim(0), T = ids.dim(1), V = h_.vocab_size;
if (B == 0 || T == 0) throw std::invalid_argument("TransformerXL: empty batch " + ids.shape_str());

Tensor x = ops::dropout(embed(ids), h_.dropout_embedding, training_, rng_);
TransformerDecoder::Output dec = decoder_.forward(x, cache ? &*cache : nullptr, max_cache_length, training_, rng_);

ForwardOutput out;
// history is fixed context for the next call, never a gradient path into it
out.cache = detach(dec.cache);

out.logits = ops::clamp(project(dec.hidden), -kClampExp, kClampExp);
out.probs = ops::softmax(*be_, out.logits);
out.preds = Tensor::empty({B, T}, DType::I32);
const float* s = out.logits.f32();
int32_t* p = out.preds.i32();
for (int64_t r = 0; r < B*T; ++r) p[r] = sample_greedy(s + r*V, V);

VLOG(1) << "forward batch=" << B << " seq=" << T << " cache " << (cache ? cache->length() : 0)
<< " -> " << out.cache.length();
return out;
}


std::vector<ParamGroup> TransformerXL::param_groups() const {
std::vector<ParamGroup> groups{EmbeddingLike{word_embedding_}};
auto dec = decoder_.param_groups();
groups.insert(groups.end(), dec.begin(), dec.end());
return groups;
}


void TransformerXL::init_weights(){
init_params(param_groups(), h_.initializer_range, rng_);
}


std::vector<Tensor> TransformerXL::parameters() const {
return parameters_of(param_groups());
}


int64_t TransformerXL::num_parameters() const {
int64_t n = 0;
for (const auto& t : parameters()) n += t.numel();
return n;
}


} // namespace txl
