#pragma once
#include <cstdint>
#include <stdexcept>
#include <vector>


namespace txl {


// Index of the largest score; ties go to the lowest index.
inline int sample_greedy(const float* logits, int64_t n){
if (n <= 0) throw std::invalid_argument("sample_greedy: empty row");
int idx=0; float best=logits[0];
for(int64_t i=1;i<n;++i) if (logits[i]>best){ best=logits[i]; idx=(int)i; }
return idx;
}


inline int sample_greedy(const std::vector<float>& logits){
return sample_greedy(logits.data(), (int64_t)logits.size());
}


} // namespace txl
