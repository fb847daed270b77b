#pragma once
#include <cstdint>
#include <memory>
#include "core/tensor.h"


namespace txl {


class IBackend {
public:
virtual ~IBackend() = default;
virtual Device device() const = 0;


// Row-major C[M,N] = alpha * op(A) * op(B) + beta * C,
// op(A) is [M,K] (stored [K,M] when trans_a), op(B) is [K,N] (stored [N,K] when trans_b).
virtual void gemm(bool trans_a, bool trans_b, int64_t M, int64_t N, int64_t K,
float alpha, const float* A, const float* B, float beta, float* C) = 0;
// Softmax over the last axis of a host f32 tensor.
virtual void softmax_inplace(Tensor& x) = 0;
};


std::shared_ptr<IBackend> MakeCPUBackend();
std::shared_ptr<IBackend> MakeCUDABackend(int device=0);


} // namespace txl
