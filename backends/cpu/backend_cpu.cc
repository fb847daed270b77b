#include "backends/backend.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>


namespace txl {


class CPUBackend final : public IBackend {
public:
Device device() const override { return Device::cpu(); }
void gemm(bool trans_a, bool trans_b, int64_t M, int64_t N, int64_t K,
float alpha, const float* A, const float* B, float beta, float* C) override {
// naive GEMM, k-inner
for(int64_t m=0;m<M;++m)
for(int64_t n=0;n<N;++n){
float acc=0.f;
for(int64_t k=0;k<K;++k){
const float a = trans_a ? A[k*M+m] : A[m*K+k];
const float b = trans_b ? B[n*K+k] : B[k*N+n];
acc += a*b;
}
C[m*N+n] = alpha*acc + (beta==0.f ? 0.f : beta*C[m*N+n]);
}
}
void softmax_inplace(Tensor& x) override {
if (x.ndim()==0) throw std::invalid_argument("softmax: scalar input");
const int64_t cols = x.shape().back();
const int64_t rows = cols ? x.numel()/cols : 0;
float* p = x.f32();
for(int64_t r=0;r<rows;++r){
float* row = p + r*cols;
const float mx = *std::max_element(row, row+cols);
float sum = 0.f;
for(int64_t c=0;c<cols;++c){ row[c] = std::exp(row[c]-mx); sum += row[c]; }
const float inv = 1.f/sum;
for(int64_t c=0;c<cols;++c) row[c] *= inv;
}
}
};


std::shared_ptr<IBackend> MakeCPUBackend(){ return std::make_shared<CPUBackend>(); }


} // namespace txl
