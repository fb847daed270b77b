#include <gtest/gtest.h>
#include "core/ops.h"
#include "backends/backend.h"
#include "models/sampler.h"
#include <cmath>
#include <random>
#include <stdexcept>

using namespace txl;

TEST(Ops, ClampSaturatesExactlyAtBounds) {
  Tensor x = Tensor::from_vector({6}, {-100.f, -15.f, -14.9f, 0.f, 15.f, 20.f});
  Tensor y = ops::clamp(x, -15.f, 15.f);
  const float expected[] = {-15.f, -15.f, -14.9f, 0.f, 15.f, 15.f};
  for (int i = 0; i < 6; ++i) EXPECT_EQ(y.f32()[i], expected[i]);
}

TEST(Ops, SoftmaxRowsSumToOne) {
  auto be = MakeCPUBackend();
  Tensor x = Tensor::from_vector({2, 3}, {15.f, 15.f, -15.f, 0.f, 1.f, 2.f});
  Tensor p = ops::softmax(*be, x);
  for (int r = 0; r < 2; ++r) {
    float sum = 0.f;
    for (int c = 0; c < 3; ++c) sum += p.f32()[r * 3 + c];
    EXPECT_NEAR(sum, 1.f, 1e-6f);
  }
  EXPECT_FLOAT_EQ(p.f32()[0], p.f32()[1]);
  EXPECT_GT(p.f32()[5], p.f32()[4]);
}

TEST(Ops, EmbeddingLooksUpRows) {
  Tensor w = Tensor::from_vector({3, 2}, {0, 1, 10, 11, 20, 21});
  Tensor ids = Tensor::from_ids({1, 2}, {2, 0});
  Tensor e = ops::embedding(ids, w);
  ASSERT_EQ(e.shape(), (std::vector<int64_t>{1, 2, 2}));
  EXPECT_EQ(e.f32()[0], 20.f);
  EXPECT_EQ(e.f32()[3], 1.f);
}

TEST(Ops, EmbeddingRejectsIdsOutsideVocab) {
  Tensor w = Tensor::zeros({5, 2}, DType::F32);
  EXPECT_THROW(ops::embedding(Tensor::from_ids({1}, {5}), w), std::out_of_range);
  EXPECT_THROW(ops::embedding(Tensor::from_ids({1}, {-1}), w), std::out_of_range);
  EXPECT_THROW(ops::embedding(Tensor::from_vector({1}, {1.f}), w), std::invalid_argument);
}

TEST(Ops, LinearHasNoImplicitBias) {
  auto be = MakeCPUBackend();
  Tensor x = Tensor::from_vector({1, 2}, {1.f, 2.f});
  Tensor w = Tensor::from_vector({3, 2}, {1, 0, 0, 1, 1, 1});
  Tensor y = ops::linear(be, x, w);
  ASSERT_EQ(y.shape(), (std::vector<int64_t>{1, 3}));
  EXPECT_EQ(y.f32()[0], 1.f);
  EXPECT_EQ(y.f32()[1], 2.f);
  EXPECT_EQ(y.f32()[2], 3.f);
  EXPECT_THROW(ops::linear(be, Tensor::zeros({1, 3}, DType::F32), w), std::invalid_argument);
}

TEST(Ops, LayerNormNormalisesRows) {
  Tensor x = Tensor::from_vector({1, 4}, {1.f, 2.f, 3.f, 4.f});
  Tensor y = ops::layer_norm(x, Tensor::full({4}, 1.f), Tensor::zeros({4}, DType::F32), 1e-5f);
  float mean = 0.f, var = 0.f;
  for (int i = 0; i < 4; ++i) mean += y.f32()[i] / 4;
  for (int i = 0; i < 4; ++i) var += (y.f32()[i] - mean) * (y.f32()[i] - mean) / 4;
  EXPECT_NEAR(mean, 0.f, 1e-6f);
  EXPECT_NEAR(var, 1.f, 1e-3f);
}

TEST(Ops, DropoutIsIdentityOutsideTraining) {
  std::mt19937 rng(1);
  Tensor x = Tensor::full({8}, 3.f);
  EXPECT_TRUE(ops::dropout(x, 0.5f, false, rng).same_storage(x));
  EXPECT_TRUE(ops::dropout(x, 0.f, true, rng).same_storage(x));

  Tensor y = ops::dropout(x, 0.5f, true, rng);
  for (int i = 0; i < 8; ++i) EXPECT_TRUE(y.f32()[i] == 0.f || y.f32()[i] == 6.f);
}

TEST(Ops, ConcatNarrowAndTranspose) {
  Tensor a = Tensor::from_vector({1, 2}, {0, 1});
  Tensor b = Tensor::from_vector({2, 2}, {2, 3, 4, 5});
  Tensor c = ops::concat0(a, b);
  ASSERT_EQ(c.shape(), (std::vector<int64_t>{3, 2}));
  Tensor n = ops::narrow0(c, 1, 2);
  EXPECT_EQ(n.f32()[0], 2.f);
  EXPECT_EQ(n.f32()[3], 5.f);
  EXPECT_THROW(ops::narrow0(c, 2, 2), std::out_of_range);
  EXPECT_THROW(ops::concat0(a, Tensor::zeros({1, 3}, DType::F32)), std::invalid_argument);

  Tensor t = ops::transpose01(Tensor::from_vector({2, 3, 1}, {0, 1, 2, 3, 4, 5}));
  ASSERT_EQ(t.shape(), (std::vector<int64_t>{3, 2, 1}));
  EXPECT_EQ(t.f32()[1], 3.f); // t[0][1] = x[1][0]
  EXPECT_EQ(t.f32()[4], 2.f); // t[2][0] = x[0][2]
}

TEST(Ops, GreedyTieGoesToLowestIndex) {
  EXPECT_EQ(sample_greedy({1.f, 3.f, 3.f, 2.f}), 1);
  EXPECT_EQ(sample_greedy({15.f, 15.f}), 0);
  EXPECT_THROW(sample_greedy(std::vector<float>{}), std::invalid_argument);
}

TEST(Ops, CrossEntropyOfUniformLogits) {
  Tensor logits = Tensor::zeros({2, 4}, DType::F32);
  Tensor loss = ops::cross_entropy(logits, Tensor::from_ids({2}, {0, 3}));
  EXPECT_NEAR(loss.f32()[0], std::log(4.f), 1e-6f);
  EXPECT_THROW(ops::cross_entropy(logits, Tensor::from_ids({2}, {0, 4})), std::out_of_range);
}

TEST(Ops, AttentionFirstQueryWithoutMemorySeesOnlyItself) {
  std::mt19937 rng(2);
  // T=2, B=1, H=1, D=2
  Tensor q = Tensor::from_vector({2, 1, 1, 2}, {0.3f, -0.2f, 1.f, 0.5f});
  Tensor k = Tensor::from_vector({2, 1, 1, 2}, {0.1f, 0.4f, -0.7f, 0.2f});
  Tensor v = Tensor::from_vector({2, 1, 1, 2}, {1.f, 2.f, 3.f, 4.f});
  Tensor pos = Tensor::zeros({4, 2}, DType::F32);
  Tensor u = Tensor::zeros({1, 2}, DType::F32);
  Tensor r = Tensor::zeros({1, 2}, DType::F32);
  Tensor out = ops::rel_attention(q, k, v, pos, u, r, 0, 0.f, false, rng);
  EXPECT_FLOAT_EQ(out.f32()[0], 1.f);
  EXPECT_FLOAT_EQ(out.f32()[1], 2.f);
  // second query mixes both values
  EXPECT_GT(out.f32()[2], 1.f);
  EXPECT_LT(out.f32()[2], 3.f);
}

TEST(Ops, AttentionIsCausalOverMemoryAndSegment) {
  std::mt19937 rng(4);
  std::normal_distribution<float> dist;
  auto randn = [&](const std::vector<int64_t>& shape) {
    Tensor t = Tensor::empty(shape, DType::F32);
    for (int64_t i = 0; i < t.numel(); ++i) t.f32()[i] = dist(rng);
    return t;
  };
  // mem_len=2, T=3, B=1, H=2, D=2
  Tensor q = randn({3, 1, 2, 2});
  Tensor k = randn({5, 1, 2, 2});
  Tensor v = randn({5, 1, 2, 2});
  Tensor pos = randn({3, 4});
  Tensor u = randn({2, 2});
  Tensor r = randn({2, 2});
  Tensor a = ops::rel_attention(q, k, v, pos, u, r, 2, 0.f, false, rng);

  // the last key belongs to the last query only
  Tensor v2 = v.clone();
  for (int i = 16; i < 20; ++i) v2.f32()[i] += 10.f;
  Tensor b = ops::rel_attention(q, k, v2, pos, u, r, 2, 0.f, false, rng);
  for (int i = 0; i < 8; ++i) EXPECT_EQ(a.f32()[i], b.f32()[i]);
  EXPECT_NE(a.f32()[8], b.f32()[8]);

  EXPECT_THROW(ops::rel_attention(q, k, v, pos, u, r, 1, 0.f, false, rng), std::invalid_argument);
}
