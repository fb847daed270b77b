#pragma once
#include <memory>
#include <optional>
#include "txlinfer/txlinfer.h"
#include "core/kv_cache.h"
#include "models/transformer_xl.h"
#include "backends/backend.h"


namespace txl {


// Greedy streaming decoder over TransformerXL. Holds one stream's cache
// between generate() calls.
class TXLEngine : public Engine {
public:
explicit TXLEngine(std::shared_ptr<IBackend> be);
void init(const ModelConfig& cfg) override;
std::vector<int> generate(const std::vector<int>& prompt_ids, const GenerateParams& p) override;
void reset() override { cache_.reset(); }
int64_t cached_length() const override { return cache_ ? cache_->length() : 0; }

TransformerXL& model();
private:
// feeds one [1, n] segment through `cache` and returns the prediction at its
// last position
int step(const std::vector<int>& ids, int64_t max_cache_length, std::optional<KVCache>& cache);

std::shared_ptr<IBackend> be_;
std::unique_ptr<TransformerXL> model_;
std::optional<KVCache> cache_;
};


} // namespace txl
