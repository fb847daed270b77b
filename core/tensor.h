#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <memory>
#include <string>


namespace txl {


enum class DeviceType { CPU, CUDA };


enum class DType { F32, I32 };


struct Device {
DeviceType type {DeviceType::CPU};
int index {0};
static Device cpu() { return {DeviceType::CPU, 0}; }
static Device cuda(int i=0) { return {DeviceType::CUDA, i}; }
};


struct TensorDesc {
std::vector<int64_t> shape;
DType dtype {DType::F32};
Device device {Device::cpu()};
bool contiguous {true};
};


// Owns one allocation; shared by every Tensor handle viewing it.
class Storage {
  public:
  Storage(size_t bytes, Device dev);
  ~Storage();
  Storage(const Storage&) = delete;
  Storage& operator=(const Storage&) = delete;

  void* data() { return data_; }
  const void* data() const { return data_; }
  size_t nbytes() const { return nbytes_; }
  Device device() const { return device_; }

  private:
  void* data_ {nullptr};
  size_t nbytes_ {0};
  Device device_ {Device::cpu()};
  };


struct AutogradMeta;
class Node;


class Tensor {
  public:
  Tensor() = default;
  explicit Tensor(const TensorDesc& d);


  void* data() { return storage_ ? storage_->data() : nullptr; }
  const void* data() const { return storage_ ? storage_->data() : nullptr; }
  float* f32();
  const float* f32() const;
  int32_t* i32();
  const int32_t* i32() const;


  bool defined() const { return storage_ != nullptr; }
  const TensorDesc& desc() const { return desc_; }
  const std::vector<int64_t>& shape() const { return desc_.shape; }
  size_t nbytes() const;
  int64_t numel() const;
  int64_t dim(size_t i) const { return desc_.shape.at(i); }
  size_t ndim() const { return desc_.shape.size(); }
  bool same_storage(const Tensor& o) const { return storage_ && storage_ == o.storage_; }
  std::string shape_str() const;


  static Tensor zeros(const std::vector<int64_t>& shape, DType dt, Device dev = Device::cpu());
  static Tensor empty(const std::vector<int64_t>& shape, DType dt, Device dev = Device::cpu());
  static Tensor full(const std::vector<int64_t>& shape, float value);
  static Tensor from_vector(const std::vector<int64_t>& shape, const std::vector<float>& values);
  static Tensor from_ids(const std::vector<int64_t>& shape, const std::vector<int32_t>& ids);


  // Same storage, new shape; carries no autograd state.
  Tensor view(const std::vector<int64_t>& shape) const;
  // Deep copy; carries no autograd state.
  Tensor clone() const;
  Tensor to(Device dev) const;


  // autograd
  bool requires_grad() const;
  Tensor& set_requires_grad(bool on);
  const std::shared_ptr<Node>& grad_fn() const;
  Tensor grad() const;
  void zero_grad();
  // Same storage and values, no history.
  Tensor detach() const;
  void backward() const;
  const std::shared_ptr<AutogradMeta>& autograd_meta() const { return meta_; }
  void set_grad_fn(std::shared_ptr<Node> fn);


  private:
  TensorDesc desc_{};
  std::shared_ptr<Storage> storage_;
  std::shared_ptr<AutogradMeta> meta_;
  };


size_t dtype_size(DType d);
int64_t shape_numel(const std::vector<int64_t>& shape);


} // namespace txl
