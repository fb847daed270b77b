#include <gtest/gtest.h>
#include "core/autograd.h"
#include "core/ops.h"
#include "backends/backend.h"
#include <cmath>
#include <functional>
#include <random>

using namespace txl;

namespace {

Tensor randn(const std::vector<int64_t>& shape, std::mt19937& rng, float scale = 0.5f) {
  Tensor t = Tensor::empty(shape, DType::F32);
  std::normal_distribution<float> dist(0.f, scale);
  for (int64_t i = 0; i < t.numel(); ++i) t.f32()[i] = dist(rng);
  t.set_requires_grad(true);
  return t;
}

// Central differences against the analytic gradient of a scalar loss.
void expect_grad_matches(const std::function<Tensor()>& loss_fn, Tensor& p, const char* name) {
  constexpr float eps = 1e-2f;
  p.zero_grad();
  loss_fn().backward();
  ASSERT_TRUE(p.grad().defined()) << name;
  Tensor analytic = p.grad().clone();
  NoGradGuard no_grad;
  for (int64_t i = 0; i < p.numel(); ++i) {
    const float saved = p.f32()[i];
    p.f32()[i] = saved + eps;
    const float up = loss_fn().f32()[0];
    p.f32()[i] = saved - eps;
    const float down = loss_fn().f32()[0];
    p.f32()[i] = saved;
    const float numeric = (up - down) / (2 * eps);
    EXPECT_NEAR(analytic.f32()[i], numeric, 1e-2f * (1.f + std::fabs(numeric))) << name << "[" << i << "]";
  }
}

}  // namespace

TEST(Autograd, LinearOfSumHasClosedFormGradients) {
  auto be = MakeCPUBackend();
  Tensor x = Tensor::from_vector({2, 3}, {1, 2, 3, 4, 5, 6});
  Tensor w = Tensor::from_vector({4, 3}, {1, 0, 0, 0, 1, 0, 0, 0, 1, 1, 1, 1});
  Tensor b = Tensor::zeros({4}, DType::F32);
  x.set_requires_grad(true);
  w.set_requires_grad(true);
  b.set_requires_grad(true);

  ops::sum(ops::linear(be, x, w, b)).backward();

  // d/dx[n,k] = sum_m w[m,k]
  for (int n = 0; n < 2; ++n)
    for (int k = 0; k < 3; ++k) EXPECT_FLOAT_EQ(x.grad().f32()[n * 3 + k], 2.f);
  // d/dw[m,k] = sum_n x[n,k]
  for (int m = 0; m < 4; ++m) {
    EXPECT_FLOAT_EQ(w.grad().f32()[m * 3 + 0], 5.f);
    EXPECT_FLOAT_EQ(w.grad().f32()[m * 3 + 1], 7.f);
    EXPECT_FLOAT_EQ(w.grad().f32()[m * 3 + 2], 9.f);
    EXPECT_FLOAT_EQ(b.grad().f32()[m], 2.f);
  }
}

TEST(Autograd, FeedForwardPathMatchesFiniteDifferences) {
  auto be = MakeCPUBackend();
  std::mt19937 rng(7);
  Tensor x = randn({3, 4}, rng, 1.f);
  Tensor gamma = randn({4}, rng);
  Tensor beta = randn({4}, rng);
  Tensor w = randn({5, 4}, rng);
  Tensor bias = randn({5}, rng);
  Tensor targets = Tensor::from_ids({3}, {0, 3, 4});

  auto loss = [&] {
    Tensor h = ops::gelu(ops::layer_norm(x, gamma, beta, 1e-5f));
    return ops::cross_entropy(ops::linear(be, h, w, bias), targets);
  };
  expect_grad_matches(loss, x, "x");
  expect_grad_matches(loss, gamma, "gamma");
  expect_grad_matches(loss, beta, "beta");
  expect_grad_matches(loss, w, "w");
  expect_grad_matches(loss, bias, "bias");
}

TEST(Autograd, RelativeAttentionMatchesFiniteDifferences) {
  std::mt19937 rng(11);
  const int64_t T = 2, B = 1, H = 2, D = 2, mem = 2;
  Tensor q = randn({T, B, H, D}, rng);
  Tensor k = randn({mem + T, B, H, D}, rng);
  Tensor v = randn({mem + T, B, H, D}, rng);
  Tensor pos = randn({3, H * D}, rng);
  Tensor u = randn({H, D}, rng);
  Tensor r = randn({H, D}, rng);
  Tensor targets = Tensor::from_ids({T * B}, {1, 3});
  std::mt19937 drop_rng(0);

  auto loss = [&] {
    Tensor out = ops::rel_attention(q, k, v, pos, u, r, mem, 0.f, false, drop_rng);
    return ops::cross_entropy(ops::reshape(out, {T * B, H * D}), targets);
  };
  expect_grad_matches(loss, q, "q");
  expect_grad_matches(loss, k, "k");
  expect_grad_matches(loss, v, "v");
  expect_grad_matches(loss, pos, "pos");
  expect_grad_matches(loss, u, "u");
  expect_grad_matches(loss, r, "r");
}

TEST(Autograd, LayoutOpsMatchFiniteDifferences) {
  std::mt19937 rng(3);
  Tensor x = randn({2, 3, 2}, rng);
  Tensor y = randn({1, 2, 2}, rng);
  Tensor targets = Tensor::from_ids({6}, {0, 1, 1, 0, 1, 0});

  auto loss = [&] {
    Tensor t = ops::transpose01(x);                   // [3, 2, 2]
    Tensor c = ops::concat0(y, t);                    // [4, 2, 2]
    return ops::cross_entropy(ops::narrow0(c, 1, 3), targets);
  };
  expect_grad_matches(loss, x, "x");
  expect_grad_matches(loss, y, "y");
}

TEST(Autograd, SharedWeightAccumulatesBothRoles) {
  auto be = MakeCPUBackend();
  std::mt19937 rng(5);
  Tensor w = randn({6, 3}, rng);
  const std::vector<int32_t> rows = {1, 4};
  Tensor ids = Tensor::from_ids({2}, rows);

  // sum(embed(ids) @ w^T): the projection sees the looked-up rows, and the
  // looked-up rows see the column sums of w
  ops::sum(ops::linear(be, ops::embedding(ids, w), w)).backward();
  Tensor g = w.grad();
  ASSERT_TRUE(g.defined());

  const float* pw = w.f32();
  for (int64_t m = 0; m < 6; ++m)
    for (int64_t k = 0; k < 3; ++k) {
      float expected = pw[rows[0] * 3 + k] + pw[rows[1] * 3 + k];
      if (m == rows[0] || m == rows[1]) {
        float col = 0.f;
        for (int64_t j = 0; j < 6; ++j) col += pw[j * 3 + k];
        expected += col;
      }
      EXPECT_NEAR(g.f32()[m * 3 + k], expected, 1e-5f) << m << "," << k;
    }
}

TEST(Autograd, BackwardNeedsScalarOrSeed) {
  Tensor w = Tensor::full({3}, 2.f);
  w.set_requires_grad(true);
  Tensor y = ops::add(w, w);
  EXPECT_THROW(y.backward(), std::logic_error);
  autograd::backward(y, Tensor::full({3}, 1.f));
  EXPECT_FLOAT_EQ(w.grad().f32()[0], 2.f);

  Tensor c = Tensor::full({1}, 1.f);
  EXPECT_THROW(c.backward(), std::logic_error);
}

TEST(Autograd, NoGradGuardSkipsRecording) {
  Tensor w = Tensor::full({2}, 1.f);
  w.set_requires_grad(true);
  {
    NoGradGuard guard;
    EXPECT_FALSE(grad_enabled());
    Tensor y = ops::add(w, w);
    EXPECT_FALSE(y.requires_grad());
    EXPECT_TRUE(y.grad_fn() == nullptr);
  }
  EXPECT_TRUE(grad_enabled());
  EXPECT_TRUE(ops::add(w, w).requires_grad());
}

TEST(Autograd, CollectNodesWalksTheGraph) {
  auto be = MakeCPUBackend();
  Tensor w = Tensor::full({2, 2}, 1.f);
  w.set_requires_grad(true);
  Tensor x = Tensor::full({1, 2}, 1.f);
  Tensor y = ops::add(ops::linear(be, x, w), x);
  auto nodes = autograd::collect_nodes(y);
  ASSERT_EQ(nodes.size(), 2u);
  EXPECT_TRUE(nodes.count(y.grad_fn().get()));
  EXPECT_TRUE(autograd::collect_nodes(x).empty());
}
