#include "backends/backend.h"
#ifdef TXL_WITH_CUDA
#include <cublas_v2.h>
#include <cuda_runtime.h>
#include <stdexcept>
#include <string>


namespace txl {


namespace {
void check_cuda(cudaError_t e, const char* what){
if (e != cudaSuccess) throw std::runtime_error(std::string(what) + ": " + cudaGetErrorString(e));
}
void check_cublas(cublasStatus_t s, const char* what){
if (s != CUBLAS_STATUS_SUCCESS) throw std::runtime_error(std::string(what) + ": cublas status " + std::to_string((int)s));
}
}


// GEMMs run through cuBLAS on staged device copies; everything else stays on the host.
class CUDABackend final : public IBackend {
public:
explicit CUDABackend(int dev): dev_(dev), host_(MakeCPUBackend()) {
check_cuda(cudaSetDevice(dev_), "cudaSetDevice");
check_cublas(cublasCreate(&handle_), "cublasCreate");
check_cublas(cublasSetMathMode(handle_, CUBLAS_TF32_TENSOR_OP_MATH), "cublasSetMathMode");
}
~CUDABackend(){ cublasDestroy(handle_); }
Device device() const override { return Device::cuda(dev_); }


void gemm(bool trans_a, bool trans_b, int64_t M, int64_t N, int64_t K,
float alpha, const float* A, const float* B, float beta, float* C) override {
if (M==0 || N==0) return;
check_cuda(cudaSetDevice(dev_), "cudaSetDevice");
Tensor dA = Tensor::empty({M*K}, DType::F32, device());
Tensor dB = Tensor::empty({K*N}, DType::F32, device());
Tensor dC = Tensor::empty({M*N}, DType::F32, device());
check_cuda(cudaMemcpy(dA.data(), A, dA.nbytes(), cudaMemcpyHostToDevice), "cudaMemcpy A");
check_cuda(cudaMemcpy(dB.data(), B, dB.nbytes(), cudaMemcpyHostToDevice), "cudaMemcpy B");
if (beta != 0.f)
check_cuda(cudaMemcpy(dC.data(), C, dC.nbytes(), cudaMemcpyHostToDevice), "cudaMemcpy C");
// row-major C = op(A) op(B) is column-major C^T = op(B)^T op(A)^T
check_cublas(cublasSgemm(handle_,
trans_b ? CUBLAS_OP_T : CUBLAS_OP_N, trans_a ? CUBLAS_OP_T : CUBLAS_OP_N,
(int)N, (int)M, (int)K, &alpha,
static_cast<const float*>(dB.data()), (int)(trans_b ? K : N),
static_cast<const float*>(dA.data()), (int)(trans_a ? M : K),
&beta, static_cast<float*>(dC.data()), (int)N), "cublasSgemm");
check_cuda(cudaMemcpy(C, dC.data(), dC.nbytes(), cudaMemcpyDeviceToHost), "cudaMemcpy C");
}
void softmax_inplace(Tensor& x) override { host_->softmax_inplace(x); }
private:
int dev_ {0};
std::shared_ptr<IBackend> host_;
cublasHandle_t handle_ {nullptr};
};


std::shared_ptr<IBackend> MakeCUDABackend(int device){ return std::make_shared<CUDABackend>(device); }


} // namespace txl
#endif
