#include "core/autograd.h"
#include <glog/logging.h>
#include <stdexcept>
#include <unordered_map>
#include <utility>


namespace txl {


namespace {
thread_local bool g_grad_enabled = true;
}


bool grad_enabled() { return g_grad_enabled; }

NoGradGuard::NoGradGuard() : prev_(g_grad_enabled) { g_grad_enabled = false; }
NoGradGuard::~NoGradGuard() { g_grad_enabled = prev_; }


namespace autograd {


bool any_requires_grad(std::initializer_list<const Tensor*> inputs){
for (const Tensor* t : inputs) if (t && t->defined() && t->requires_grad()) return true;
return false;
}


void record(Tensor& out, const char* name, std::initializer_list<const Tensor*> inputs,
Node::BackwardFn fn){
if (!g_grad_enabled || !any_requires_grad(inputs)) return;
std::vector<std::shared_ptr<AutogradMeta>> next;
next.reserve(inputs.size());
for (const Tensor* t : inputs)
next.push_back(t && t->defined() && t->requires_grad() ? t->autograd_meta() : nullptr);
out.set_grad_fn(std::make_shared<Node>(name, std::move(next), std::move(fn)));
}


void accumulate(Tensor& acc, const Tensor& g){
if (!acc.defined()) { acc = g.clone(); return; }
if (acc.numel() != g.numel())
throw std::logic_error("gradient shape " + g.shape_str() + " does not match " + acc.shape_str());
float* a = acc.f32();
const float* b = g.f32();
for (int64_t i = 0; i < acc.numel(); ++i) a[i] += b[i];
}


namespace {

// Post-order over the metadata graph; reversed it is a valid backward order.
std::vector<AutogradMeta*> topo_order(AutogradMeta* root){
std::vector<AutogradMeta*> order;
std::unordered_set<AutogradMeta*> seen;
std::vector<std::pair<AutogradMeta*, size_t>> stack;
stack.emplace_back(root, 0);
seen.insert(root);
while (!stack.empty()) {
auto& [meta, idx] = stack.back();
const size_t n_next = meta->grad_fn ? meta->grad_fn->next().size() : 0;
if (idx < n_next) {
AutogradMeta* child = meta->grad_fn->next()[idx++].get();
if (child && seen.insert(child).second) stack.emplace_back(child, 0);
continue;
}
order.push_back(meta);
stack.pop_back();
}
return order;
}

} // namespace


void backward(const Tensor& root, const Tensor& seed){
if (!root.requires_grad())
throw std::logic_error("backward: tensor does not require grad");
Tensor g0 = seed;
if (!g0.defined()) {
if (root.numel() != 1)
throw std::logic_error("backward: implicit seed needs a scalar, got " + root.shape_str());
g0 = Tensor::full(root.shape(), 1.0f);
}

AutogradMeta* top = root.autograd_meta().get();
std::vector<AutogradMeta*> order = topo_order(top);
std::unordered_map<AutogradMeta*, Tensor> grads;
grads[top] = g0;
VLOG(2) << "backward over " << order.size() << " graph entries";

for (auto it = order.rbegin(); it != order.rend(); ++it) {
AutogradMeta* meta = *it;
auto found = grads.find(meta);
if (found == grads.end()) continue;
Tensor g = std::move(found->second);
grads.erase(found);
if (!meta->grad_fn) {
if (meta->requires_grad) accumulate(meta->grad, g);
continue;
}
std::vector<Tensor> in_grads = meta->grad_fn->apply(g);
const auto& next = meta->grad_fn->next();
if (in_grads.size() != next.size())
throw std::logic_error("backward: node " + meta->grad_fn->name() + " returned wrong gradient count");
for (size_t i = 0; i < next.size(); ++i) {
if (!next[i] || !in_grads[i].defined()) continue;
accumulate(grads[next[i].get()], in_grads[i]);
}
}
}


std::unordered_set<const Node*> collect_nodes(const Tensor& root){
std::unordered_set<const Node*> nodes;
if (!root.grad_fn()) return nodes;
std::vector<const Node*> stack{root.grad_fn().get()};
nodes.insert(stack.back());
while (!stack.empty()) {
const Node* n = stack.back();
stack.pop_back();
for (const auto& m : n->next()) {
if (!m || !m->grad_fn) continue;
if (nodes.insert(m->grad_fn.get()).second) stack.push_back(m->grad_fn.get());
}
}
return nodes;
}


} // namespace autograd
} // namespace txl
