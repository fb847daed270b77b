#include "core/tensor.h"
#include "core/autograd.h"
#include <cstdlib>
#include <cstring>
#include <new>
#include <sstream>
#include <stdexcept>

#ifdef TXL_WITH_CUDA
#include <cuda_runtime.h>
#endif

namespace txl
{

  size_t dtype_size(DType d)
  {
    switch (d)
    {
    case DType::F32:
      return 4;
    case DType::I32:
      return 4;
    }
    return 0;
  }

  int64_t shape_numel(const std::vector<int64_t> &shape)
  {
    int64_t n = 1;
    for (auto s : shape)
    {
      if (s < 0)
        throw std::invalid_argument("negative tensor dimension");
      n *= s;
    }
    return n;
  }

  Storage::Storage(size_t bytes, Device dev) : nbytes_(bytes), device_(dev)
  {
    if (device_.type == DeviceType::CPU)
    {
      const size_t padded = bytes == 0 ? 64 : ((bytes + 63) / 64) * 64;
      data_ = std::aligned_alloc(64, padded);
      if (!data_)
        throw std::bad_alloc();
      std::memset(data_, 0, padded);
    }
    else
    {
#ifdef TXL_WITH_CUDA
      if (cudaSetDevice(device_.index) != cudaSuccess ||
          cudaMalloc(&data_, bytes == 0 ? 1 : bytes) != cudaSuccess)
        throw std::runtime_error("cudaMalloc failed");
      if (cudaMemset(data_, 0, bytes) != cudaSuccess)
        throw std::runtime_error("cudaMemset failed");
#else
      throw std::runtime_error("CUDA not enabled");
#endif
    }
  }

  Storage::~Storage()
  {
    if (!data_)
      return;
    if (device_.type == DeviceType::CPU)
    {
      std::free(data_);
    }
    else
    {
#ifdef TXL_WITH_CUDA
      cudaSetDevice(device_.index);
      cudaFree(data_);
#endif
    }
  }

  Tensor::Tensor(const TensorDesc &d)
      : desc_(d), storage_(std::make_shared<Storage>(nbytes(), d.device)) {}

  size_t Tensor::nbytes() const
  {
    return (size_t)shape_numel(desc_.shape) * dtype_size(desc_.dtype);
  }

  int64_t Tensor::numel() const
  {
    return shape_numel(desc_.shape);
  }

  float *Tensor::f32()
  {
    if (desc_.dtype != DType::F32)
      throw std::invalid_argument("expected f32 tensor");
    return static_cast<float *>(data());
  }

  const float *Tensor::f32() const
  {
    if (desc_.dtype != DType::F32)
      throw std::invalid_argument("expected f32 tensor");
    return static_cast<const float *>(data());
  }

  int32_t *Tensor::i32()
  {
    if (desc_.dtype != DType::I32)
      throw std::invalid_argument("expected i32 tensor");
    return static_cast<int32_t *>(data());
  }

  const int32_t *Tensor::i32() const
  {
    if (desc_.dtype != DType::I32)
      throw std::invalid_argument("expected i32 tensor");
    return static_cast<const int32_t *>(data());
  }

  std::string Tensor::shape_str() const
  {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < desc_.shape.size(); ++i)
      ss << (i ? ", " : "") << desc_.shape[i];
    ss << "]";
    return ss.str();
  }

  Tensor Tensor::zeros(const std::vector<int64_t> &shape, DType dt, Device dev)
  {
    // storage is zero-filled on allocation
    return Tensor(TensorDesc{shape, dt, dev, true});
  }

  Tensor Tensor::empty(const std::vector<int64_t> &shape, DType dt, Device dev)
  {
    return Tensor(TensorDesc{shape, dt, dev, true});
  }

  Tensor Tensor::full(const std::vector<int64_t> &shape, float value)
  {
    Tensor t = empty(shape, DType::F32);
    float *p = t.f32();
    for (int64_t i = 0; i < t.numel(); ++i)
      p[i] = value;
    return t;
  }

  Tensor Tensor::from_vector(const std::vector<int64_t> &shape, const std::vector<float> &values)
  {
    Tensor t = empty(shape, DType::F32);
    if ((size_t)t.numel() != values.size())
      throw std::invalid_argument("from_vector: " + std::to_string(values.size()) +
                                  " values for shape " + t.shape_str());
    std::memcpy(t.data(), values.data(), t.nbytes());
    return t;
  }

  Tensor Tensor::from_ids(const std::vector<int64_t> &shape, const std::vector<int32_t> &ids)
  {
    Tensor t = empty(shape, DType::I32);
    if ((size_t)t.numel() != ids.size())
      throw std::invalid_argument("from_ids: " + std::to_string(ids.size()) +
                                  " ids for shape " + t.shape_str());
    std::memcpy(t.data(), ids.data(), t.nbytes());
    return t;
  }

  Tensor Tensor::view(const std::vector<int64_t> &shape) const
  {
    if (shape_numel(shape) != numel())
      throw std::invalid_argument("view: cannot view " + shape_str() + " with a different element count");
    Tensor out;
    out.desc_ = desc_;
    out.desc_.shape = shape;
    out.storage_ = storage_;
    return out;
  }

  Tensor Tensor::clone() const
  {
    return to(desc_.device);
  }

  Tensor Tensor::to(Device dev) const
  {
    Tensor out(TensorDesc{desc_.shape, desc_.dtype, dev, desc_.contiguous});
    const size_t bytes = nbytes();
    if (desc_.device.type == DeviceType::CPU && dev.type == DeviceType::CPU)
    {
      std::memcpy(out.data(), data(), bytes);
    }
#ifdef TXL_WITH_CUDA
    else
    {
      cudaMemcpyKind kind = cudaMemcpyDeviceToDevice;
      if (desc_.device.type == DeviceType::CPU)
        kind = cudaMemcpyHostToDevice;
      else if (dev.type == DeviceType::CPU)
        kind = cudaMemcpyDeviceToHost;
      if (cudaMemcpy(out.data(), data(), bytes, kind) != cudaSuccess)
        throw std::runtime_error("cudaMemcpy failed");
    }
#else
    else
      throw std::runtime_error("CUDA not enabled");
#endif
    return out;
  }

  bool Tensor::requires_grad() const
  {
    return meta_ && meta_->requires_grad;
  }

  Tensor &Tensor::set_requires_grad(bool on)
  {
    if (meta_ && meta_->grad_fn)
      throw std::logic_error("set_requires_grad: only leaf tensors can be toggled");
    if (!meta_)
      meta_ = std::make_shared<AutogradMeta>();
    meta_->requires_grad = on;
    return *this;
  }

  const std::shared_ptr<Node> &Tensor::grad_fn() const
  {
    static const std::shared_ptr<Node> none;
    return meta_ ? meta_->grad_fn : none;
  }

  Tensor Tensor::grad() const
  {
    return meta_ ? meta_->grad : Tensor();
  }

  void Tensor::zero_grad()
  {
    if (meta_)
      meta_->grad = Tensor();
  }

  Tensor Tensor::detach() const
  {
    Tensor out;
    out.desc_ = desc_;
    out.storage_ = storage_;
    return out;
  }

  void Tensor::backward() const
  {
    autograd::backward(*this);
  }

  void Tensor::set_grad_fn(std::shared_ptr<Node> fn)
  {
    meta_ = std::make_shared<AutogradMeta>();
    meta_->requires_grad = true;
    meta_->grad_fn = std::move(fn);
  }

} // namespace txl
