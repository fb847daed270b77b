#pragma once
#include <cstdint>
#include <vector>
#include "core/tensor.h"


namespace txl {


struct LayerKV {
Tensor k; // [cached_len, batch, heads, head_dim]
Tensor v; // [cached_len, batch, heads, head_dim]
};


// Segment-recurrent memory, one entry per decoder layer. Owned by the caller
// across forward calls; all layers always hold the same length.
struct KVCache {
std::vector<LayerKV> layers;

bool empty() const { return layers.empty(); }
int64_t length() const { return empty() ? 0 : layers.front().k.dim(0); }
int64_t batch() const { return empty() ? 0 : layers.front().k.dim(1); }
};


class KVCacheManager {
public:
KVCacheManager(int n_layers, int heads, int head_dim);
// Memory followed by the segment; `past` may be null. This is the context a
// segment attends over.
LayerKV extend(const LayerKV* past, const Tensor& k, const Tensor& v) const;
// Keeps the newest `max_len` positions (drops from the front).
LayerKV truncate(const LayerKV& kv, int64_t max_len) const;
// Throws std::invalid_argument unless `cache` has one entry per layer, the
// given batch, this head geometry and equal lengths everywhere.
void validate(const KVCache& cache, int64_t batch) const;
private:
int n_layers_, heads_, head_dim_;
};


// Recursive detach: strips autograd history from every tensor of a
// (possibly nested) cache structure without touching shapes or values.
inline Tensor detach(const Tensor& t) { return t.detach(); }
inline LayerKV detach(const LayerKV& kv) { return {detach(kv.k), detach(kv.v)}; }

template <typename T>
std::vector<T> detach(const std::vector<T>& xs){
std::vector<T> out;
out.reserve(xs.size());
for (const auto& x : xs) out.push_back(detach(x));
return out;
}

inline KVCache detach(const KVCache& c) { return {detach(c.layers)}; }


} // namespace txl
