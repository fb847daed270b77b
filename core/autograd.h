#pragma once
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>
#include "core/tensor.h"


namespace txl {


struct AutogradMeta {
bool requires_grad {false};
std::shared_ptr<Node> grad_fn; // null for leaves
Tensor grad;                   // accumulated on leaves only
};


// One recorded op. Edges point at the autograd metadata of the op's inputs;
// a null edge marks an input that does not need a gradient.
class Node {
public:
using BackwardFn = std::function<std::vector<Tensor>(const Tensor& grad_out)>;

Node(std::string name, std::vector<std::shared_ptr<AutogradMeta>> next, BackwardFn fn)
: name_(std::move(name)), next_(std::move(next)), fn_(std::move(fn)) {}

const std::string& name() const { return name_; }
const std::vector<std::shared_ptr<AutogradMeta>>& next() const { return next_; }
std::vector<Tensor> apply(const Tensor& grad_out) const { return fn_(grad_out); }

private:
std::string name_;
std::vector<std::shared_ptr<AutogradMeta>> next_;
BackwardFn fn_;
};


bool grad_enabled();


class NoGradGuard {
public:
NoGradGuard();
~NoGradGuard();
NoGradGuard(const NoGradGuard&) = delete;
NoGradGuard& operator=(const NoGradGuard&) = delete;
private:
bool prev_;
};


namespace autograd {


bool any_requires_grad(std::initializer_list<const Tensor*> inputs);

// Attaches a backward node to `out` if grad mode is on and any input needs a
// gradient. `fn` must return one entry per input (undefined = no gradient).
void record(Tensor& out, const char* name, std::initializer_list<const Tensor*> inputs,
Node::BackwardFn fn);

// Seeds `root` with `seed` (ones if undefined; root must then be a scalar).
void backward(const Tensor& root, const Tensor& seed = Tensor());

// Every node reachable from `root`.
std::unordered_set<const Node*> collect_nodes(const Tensor& root);

// acc += g, allocating acc on first use.
void accumulate(Tensor& acc, const Tensor& g);


} // namespace autograd
} // namespace txl
