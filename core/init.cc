#include "core/init.h"
#include <stdexcept>


namespace txl {


namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void fill_normal(Tensor& t, float std, std::mt19937& rng){
std::normal_distribution<float> dist(0.f, std);
float* p = t.f32();
for (int64_t i = 0; i < t.numel(); ++i) p[i] = dist(rng);
}

void fill(Tensor& t, float value){
float* p = t.f32();
for (int64_t i = 0; i < t.numel(); ++i) p[i] = value;
}

} // namespace


void init_params(const std::vector<ParamGroup>& groups, float std, std::mt19937& rng){
if (!(std > 0.f)) throw std::invalid_argument("initializer range must be positive");
for (auto group : groups) {
std::visit(overloaded{
[&](LinearLike& g) {
fill_normal(g.weight, std, rng);
if (g.bias.defined()) fill(g.bias, 0.f);
},
[&](EmbeddingLike& g) { fill_normal(g.weight, std, rng); },
[&](NormLike& g) {
fill(g.scale, 1.f);
fill(g.shift, 0.f);
},
}, group);
}
}


std::vector<Tensor> parameters_of(const std::vector<ParamGroup>& groups){
std::vector<Tensor> out;
for (auto group : groups) {
std::visit(overloaded{
[&](LinearLike& g) {
out.push_back(g.weight);
if (g.bias.defined()) out.push_back(g.bias);
},
[&](EmbeddingLike& g) { out.push_back(g.weight); },
[&](NormLike& g) {
out.push_back(g.scale);
out.push_back(g.shift);
},
}, group);
}
return out;
}


} // namespace txl
