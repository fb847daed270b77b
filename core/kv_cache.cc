#include "core/kv_cache.h"
#include "core/ops.h"
#include <stdexcept>
#include <string>


namespace txl {


KVCacheManager::KVCacheManager(int n_layers, int heads, int head_dim)
: n_layers_(n_layers), heads_(heads), head_dim_(head_dim) {}


LayerKV KVCacheManager::extend(const LayerKV* past, const Tensor& k, const Tensor& v) const {
if (!past) return {k, v};
return {ops::concat0(past->k, k), ops::concat0(past->v, v)};
}


LayerKV KVCacheManager::truncate(const LayerKV& kv, int64_t max_len) const {
if (max_len <= 0) throw std::invalid_argument("max cache length must be positive, got " + std::to_string(max_len));
const int64_t len = kv.k.dim(0);
if (len <= max_len) return kv;
return {ops::narrow0(kv.k, len - max_len, max_len), ops::narrow0(kv.v, len - max_len, max_len)};
}


void KVCacheManager::validate(const KVCache& cache, int64_t batch) const {
if ((int)cache.layers.size() != n_layers_)
throw std::invalid_argument("cache has " + std::to_string(cache.layers.size()) + " layers, model has " +
std::to_string(n_layers_));
int64_t len = -1;
for (size_t i = 0; i < cache.layers.size(); ++i) {
const LayerKV& kv = cache.layers[i];
for (const Tensor* t : {&kv.k, &kv.v}) {
if (!t->defined() || t->ndim() != 4)
throw std::invalid_argument("cache layer " + std::to_string(i) + ": expected [len, batch, heads, head_dim]");
if (t->dim(1) != batch)
throw std::invalid_argument("cache layer " + std::to_string(i) + ": batch " + std::to_string(t->dim(1)) +
" does not match input batch " + std::to_string(batch));
if (t->dim(2) != heads_ || t->dim(3) != head_dim_)
throw std::invalid_argument("cache layer " + std::to_string(i) + ": head geometry " + t->shape_str());
if (len < 0) len = t->dim(0);
else if (t->dim(0) != len)
throw std::invalid_argument("cache layer " + std::to_string(i) + ": length " + std::to_string(t->dim(0)) +
" differs from layer 0 length " + std::to_string(len));
}
}
}


} // namespace txl
