#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>


namespace txl {


struct ModelConfig {
int n_layer{2};
int n_embedding{100};
int n_state_ffn{200};
int n_head{4};
int n_context{12}; // segment length, default cache bound
int vocab_size{1000};
int n_positional_embedding{10}; // relative distances beyond this are clipped
float dropout_residual{0.1f};
float dropout_attention{0.1f};
float dropout_embedding{0.1f};
float initializer_range{0.02f};
float layer_norm_eps{1e-5f};
uint64_t seed{1111};

int head_dim() const { return n_embedding / n_head; }

// throws std::invalid_argument
void validate() const;
};


struct GenerateParams {
int max_new_tokens = 64;
int segment_length = 0;   // 0 = n_context
int max_cache_length = 0; // 0 = n_context
};


class Engine {
public:
virtual ~Engine() = default;
virtual void init(const ModelConfig& cfg) = 0;
// Continues from whatever context is cached; returns prompt + new tokens.
virtual std::vector<int> generate(const std::vector<int>& prompt_ids,
const GenerateParams& p) = 0;
// Drops the cached context (document boundary).
virtual void reset() = 0;
virtual int64_t cached_length() const = 0;
};


std::unique_ptr<Engine> CreateEngineCPU();
std::unique_ptr<Engine> CreateEngineCUDA(int device = 0);


} // namespace txl
