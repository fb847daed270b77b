#include "models/txl_engine.h"
#include "core/autograd.h"
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>


namespace txl {


TXLEngine::TXLEngine(std::shared_ptr<IBackend> be): be_(std::move(be)) {}


void TXLEngine::init(const ModelConfig& cfg){
model_ = std::make_unique<TransformerXL>(cfg, be_);
model_->eval();
cache_.reset();
}


TransformerXL& TXLEngine::model(){
if (!model_) throw std::logic_error("TXLEngine: init() was not called");
return *model_;
}


int TXLEngine::step(const std::vector<int>& ids, int64_t max_cache_length, std::optional<KVCache>& cache){
const int64_t n = (int64_t)ids.size();
Tensor batch = Tensor::from_ids({1, n}, std::vector<int32_t>(ids.begin(), ids.end()));
ForwardOutput out = model_->forward(batch, cache, max_cache_length);
cache = std::move(out.cache);
return out.preds.i32()[n - 1];
}


std::vector<int> TXLEngine::generate(const std::vector<int>& prompt_ids, const GenerateParams& p){
TransformerXL& m = model();
if (prompt_ids.empty()) throw std::invalid_argument("TXLEngine: empty prompt");
if (p.max_new_tokens < 0) throw std::invalid_argument("TXLEngine: max_new_tokens must be >= 0");
const ModelConfig& h = m.config();
const int64_t seg = p.segment_length > 0 ? p.segment_length : h.n_context;
const int64_t max_cache = p.max_cache_length > 0 ? p.max_cache_length : h.n_context;
if (max_cache < seg)
LOG(WARNING) << "cache bound " << max_cache << " is shorter than segment length " << seg
<< "; older context is dropped mid-prompt";

NoGradGuard no_grad;
m.eval();
// committed only once every step has succeeded
std::optional<KVCache> cache = cache_;
int next = 0;
for (size_t pos = 0; pos < prompt_ids.size(); pos += seg) {
const size_t end = std::min(prompt_ids.size(), pos + (size_t)seg);
VLOG(1) << "prompt segment [" << pos << ", " << end << ")";
next = step(std::vector<int>(prompt_ids.begin() + pos, prompt_ids.begin() + end), max_cache, cache);
}

auto out = prompt_ids;
for (int i = 0; i < p.max_new_tokens; ++i) {
out.push_back(next);
// keep the cache in step with everything returned so far
next = step({next}, max_cache, cache);
}
cache_ = std::move(cache);
return out;
}


std::unique_ptr<Engine> CreateEngineCPU(){
return std::make_unique<TXLEngine>(MakeCPUBackend());
}


std::unique_ptr<Engine> CreateEngineCUDA(int device){
#ifdef TXL_WITH_CUDA
return std::make_unique<TXLEngine>(MakeCUDABackend(device));
#else
(void)device;
throw std::runtime_error("CUDA not enabled");
#endif
}


} // namespace txl
