#include "core/ops.h"
#include "core/autograd.h"
#include "backends/backend.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>


namespace txl {
namespace ops {


namespace {

void require_f32(const Tensor& t, const char* op){
if (!t.defined()) throw std::invalid_argument(std::string(op) + ": undefined tensor");
if (t.desc().dtype != DType::F32) throw std::invalid_argument(std::string(op) + ": expected f32 tensor");
if (t.desc().device.type != DeviceType::CPU) throw std::invalid_argument(std::string(op) + ": expected host tensor");
}

void require_same_shape(const Tensor& a, const Tensor& b, const char* op){
if (a.shape() != b.shape())
throw std::invalid_argument(std::string(op) + ": shape " + a.shape_str() + " vs " + b.shape_str());
}

int64_t last_dim(const Tensor& t, const char* op){
if (t.ndim() == 0) throw std::invalid_argument(std::string(op) + ": needs at least one axis");
return t.shape().back();
}

Tensor swap01(const Tensor& x){
const int64_t A = x.dim(0), B = x.dim(1);
const int64_t inner = (A*B) ? x.numel()/(A*B) : 0;
std::vector<int64_t> shape = x.shape();
std::swap(shape[0], shape[1]);
Tensor out = Tensor::empty(shape, DType::F32);
const float* src = x.f32();
float* dst = out.f32();
for (int64_t a = 0; a < A; ++a)
for (int64_t b = 0; b < B; ++b)
std::memcpy(dst + (b*A + a)*inner, src + (a*B + b)*inner, inner*sizeof(float));
return out;
}

} // namespace


Tensor embedding(const Tensor& ids, const Tensor& weight){
if (!ids.defined() || ids.desc().dtype != DType::I32)
throw std::invalid_argument("embedding: ids must be an i32 tensor");
require_f32(weight, "embedding");
if (weight.ndim() != 2) throw std::invalid_argument("embedding: weight must be 2D");
const int64_t V = weight.dim(0), E = weight.dim(1);
std::vector<int64_t> shape = ids.shape();
shape.push_back(E);
Tensor out = Tensor::empty(shape, DType::F32);

const int32_t* idx = ids.i32();
const float* w = weight.f32();
float* y = out.f32();
for (int64_t i = 0; i < ids.numel(); ++i) {
const int64_t r = idx[i];
if (r < 0 || r >= V)
throw std::out_of_range("embedding: token id " + std::to_string(r) + " outside [0, " + std::to_string(V) + ")");
std::memcpy(y + i*E, w + r*E, E*sizeof(float));
}

autograd::record(out, "embedding", {&weight}, [ids, V, E](const Tensor& g) {
Tensor gw = Tensor::zeros({V, E}, DType::F32);
const int32_t* idx = ids.i32();
const float* gy = g.f32();
float* gp = gw.f32();
for (int64_t i = 0; i < ids.numel(); ++i) {
float* row = gp + (int64_t)idx[i]*E;
for (int64_t e = 0; e < E; ++e) row[e] += gy[i*E + e];
}
return std::vector<Tensor>{gw};
});
return out;
}


Tensor linear(const std::shared_ptr<IBackend>& be, const Tensor& x, const Tensor& w, const Tensor& b){
require_f32(x, "linear");
require_f32(w, "linear");
if (w.ndim() != 2) throw std::invalid_argument("linear: weight must be 2D");
const int64_t K = last_dim(x, "linear");
const int64_t M = w.dim(0);
if (w.dim(1) != K)
throw std::invalid_argument("linear: input " + x.shape_str() + " does not match weight " + w.shape_str());
if (b.defined()) {
require_f32(b, "linear");
if (b.ndim() != 1 || b.dim(0) != M) throw std::invalid_argument("linear: bias must be [" + std::to_string(M) + "]");
}
const int64_t N = K ? x.numel()/K : 0;
std::vector<int64_t> shape = x.shape();
shape.back() = M;
Tensor out = Tensor::zeros(shape, DType::F32);
be->gemm(false, true, N, M, K, 1.f, x.f32(), w.f32(), 0.f, out.f32());
if (b.defined()) {
const float* bp = b.f32();
float* y = out.f32();
for (int64_t n = 0; n < N; ++n)
for (int64_t m = 0; m < M; ++m) y[n*M + m] += bp[m];
}

const bool need_x = x.requires_grad(), need_w = w.requires_grad();
const bool need_b = b.defined() && b.requires_grad();
autograd::record(out, "linear", {&x, &w, &b},
[be, x, w, N, M, K, need_x, need_w, need_b](const Tensor& g) {
Tensor gx, gw, gb;
if (need_x) {
gx = Tensor::zeros(x.shape(), DType::F32);
be->gemm(false, false, N, K, M, 1.f, g.f32(), w.f32(), 0.f, gx.f32());
}
if (need_w) {
gw = Tensor::zeros({M, K}, DType::F32);
be->gemm(true, false, M, K, N, 1.f, g.f32(), x.f32(), 0.f, gw.f32());
}
if (need_b) {
gb = Tensor::zeros({M}, DType::F32);
const float* gy = g.f32();
float* gp = gb.f32();
for (int64_t n = 0; n < N; ++n)
for (int64_t m = 0; m < M; ++m) gp[m] += gy[n*M + m];
}
return std::vector<Tensor>{gx, gw, gb};
});
return out;
}


Tensor add(const Tensor& a, const Tensor& b){
require_f32(a, "add");
require_f32(b, "add");
require_same_shape(a, b, "add");
Tensor out = Tensor::empty(a.shape(), DType::F32);
const float* pa = a.f32();
const float* pb = b.f32();
float* y = out.f32();
for (int64_t i = 0; i < out.numel(); ++i) y[i] = pa[i] + pb[i];
autograd::record(out, "add", {&a, &b}, [](const Tensor& g) {
return std::vector<Tensor>{g, g};
});
return out;
}


Tensor layer_norm(const Tensor& x, const Tensor& gamma, const Tensor& beta, float eps){
require_f32(x, "layer_norm");
require_f32(gamma, "layer_norm");
require_f32(beta, "layer_norm");
const int64_t E = last_dim(x, "layer_norm");
if (gamma.numel() != E || beta.numel() != E)
throw std::invalid_argument("layer_norm: affine parameters must have " + std::to_string(E) + " elements");
const int64_t rows = E ? x.numel()/E : 0;
Tensor out = Tensor::empty(x.shape(), DType::F32);
Tensor stats = Tensor::empty({rows, 2}, DType::F32); // mean, rstd

const float* px = x.f32();
const float* pg = gamma.f32();
const float* pb = beta.f32();
float* y = out.f32();
float* st = stats.f32();
for (int64_t r = 0; r < rows; ++r) {
const float* row = px + r*E;
float mean = 0.f;
for (int64_t e = 0; e < E; ++e) mean += row[e];
mean /= (float)E;
float var = 0.f;
for (int64_t e = 0; e < E; ++e) var += (row[e]-mean)*(row[e]-mean);
var /= (float)E;
const float rstd = 1.f/std::sqrt(var + eps);
st[2*r] = mean;
st[2*r+1] = rstd;
for (int64_t e = 0; e < E; ++e) y[r*E + e] = (row[e]-mean)*rstd*pg[e] + pb[e];
}

autograd::record(out, "layer_norm", {&x, &gamma, &beta}, [x, gamma, stats, rows, E](const Tensor& g) {
Tensor gx = Tensor::zeros(x.shape(), DType::F32);
Tensor gg = Tensor::zeros({E}, DType::F32);
Tensor gb = Tensor::zeros({E}, DType::F32);
const float* px = x.f32();
const float* pg = gamma.f32();
const float* st = stats.f32();
const float* gy = g.f32();
float* pgx = gx.f32();
float* pgg = gg.f32();
float* pgb = gb.f32();
for (int64_t r = 0; r < rows; ++r) {
const float mean = st[2*r], rstd = st[2*r+1];
float m1 = 0.f, m2 = 0.f;
for (int64_t e = 0; e < E; ++e) {
const float xhat = (px[r*E + e]-mean)*rstd;
const float gxhat = gy[r*E + e]*pg[e];
m1 += gxhat;
m2 += gxhat*xhat;
pgg[e] += gy[r*E + e]*xhat;
pgb[e] += gy[r*E + e];
}
m1 /= (float)E;
m2 /= (float)E;
for (int64_t e = 0; e < E; ++e) {
const float xhat = (px[r*E + e]-mean)*rstd;
pgx[r*E + e] = rstd*(gy[r*E + e]*pg[e] - m1 - xhat*m2);
}
}
return std::vector<Tensor>{gx, gg, gb};
});
return out;
}


Tensor gelu(const Tensor& x){
require_f32(x, "gelu");
constexpr float kC = 0.7978845608028654f; // sqrt(2/pi)
constexpr float kA = 0.044715f;
Tensor out = Tensor::empty(x.shape(), DType::F32);
const float* px = x.f32();
float* y = out.f32();
for (int64_t i = 0; i < x.numel(); ++i) {
const float v = px[i];
y[i] = 0.5f*v*(1.f + std::tanh(kC*(v + kA*v*v*v)));
}
autograd::record(out, "gelu", {&x}, [x](const Tensor& g) {
Tensor gx = Tensor::empty(x.shape(), DType::F32);
const float* px = x.f32();
const float* gy = g.f32();
float* p = gx.f32();
for (int64_t i = 0; i < x.numel(); ++i) {
const float v = px[i];
const float t = std::tanh(kC*(v + kA*v*v*v));
const float d = 0.5f*(1.f + t) + 0.5f*v*(1.f - t*t)*kC*(1.f + 3.f*kA*v*v);
p[i] = gy[i]*d;
}
return std::vector<Tensor>{gx};
});
return out;
}


Tensor dropout(const Tensor& x, float p, bool training, std::mt19937& rng){
require_f32(x, "dropout");
if (!training || p <= 0.f) return x;
if (p >= 1.f) throw std::invalid_argument("dropout: probability must be < 1");
Tensor mask = Tensor::empty(x.shape(), DType::F32);
Tensor out = Tensor::empty(x.shape(), DType::F32);
std::bernoulli_distribution keep(1.0 - p);
const float scale = 1.f/(1.f - p);
const float* px = x.f32();
float* pm = mask.f32();
float* y = out.f32();
for (int64_t i = 0; i < x.numel(); ++i) {
pm[i] = keep(rng) ? scale : 0.f;
y[i] = px[i]*pm[i];
}
autograd::record(out, "dropout", {&x}, [mask](const Tensor& g) {
Tensor gx = Tensor::empty(mask.shape(), DType::F32);
const float* pm = mask.f32();
const float* gy = g.f32();
float* p = gx.f32();
for (int64_t i = 0; i < mask.numel(); ++i) p[i] = gy[i]*pm[i];
return std::vector<Tensor>{gx};
});
return out;
}


Tensor clamp(const Tensor& x, float lo, float hi){
require_f32(x, "clamp");
if (lo > hi) throw std::invalid_argument("clamp: lo > hi");
Tensor out = Tensor::empty(x.shape(), DType::F32);
const float* px = x.f32();
float* y = out.f32();
for (int64_t i = 0; i < x.numel(); ++i) y[i] = std::min(std::max(px[i], lo), hi);
autograd::record(out, "clamp", {&x}, [x, lo, hi](const Tensor& g) {
Tensor gx = Tensor::empty(x.shape(), DType::F32);
const float* px = x.f32();
const float* gy = g.f32();
float* p = gx.f32();
for (int64_t i = 0; i < x.numel(); ++i) p[i] = (px[i] >= lo && px[i] <= hi) ? gy[i] : 0.f;
return std::vector<Tensor>{gx};
});
return out;
}


Tensor softmax(IBackend& be, const Tensor& x){
require_f32(x, "softmax");
const int64_t V = last_dim(x, "softmax");
Tensor out = x.clone();
be.softmax_inplace(out);
autograd::record(out, "softmax", {&x}, [out_y = out.detach(), V](const Tensor& g) {
Tensor gx = Tensor::empty(out_y.shape(), DType::F32);
const int64_t rows = V ? out_y.numel()/V : 0;
const float* y = out_y.f32();
const float* gy = g.f32();
float* p = gx.f32();
for (int64_t r = 0; r < rows; ++r) {
float dot = 0.f;
for (int64_t c = 0; c < V; ++c) dot += gy[r*V + c]*y[r*V + c];
for (int64_t c = 0; c < V; ++c) p[r*V + c] = y[r*V + c]*(gy[r*V + c] - dot);
}
return std::vector<Tensor>{gx};
});
return out;
}


Tensor reshape(const Tensor& x, const std::vector<int64_t>& shape){
Tensor out = x.view(shape);
autograd::record(out, "reshape", {&x}, [old = x.shape()](const Tensor& g) {
return std::vector<Tensor>{g.view(old)};
});
return out;
}


Tensor transpose01(const Tensor& x){
require_f32(x, "transpose01");
if (x.ndim() < 2) throw std::invalid_argument("transpose01: needs at least two axes");
Tensor out = swap01(x);
autograd::record(out, "transpose01", {&x}, [](const Tensor& g) {
return std::vector<Tensor>{swap01(g)};
});
return out;
}


Tensor concat0(const Tensor& a, const Tensor& b){
require_f32(a, "concat0");
require_f32(b, "concat0");
if (a.ndim() == 0 || a.ndim() != b.ndim() ||
!std::equal(a.shape().begin() + 1, a.shape().end(), b.shape().begin() + 1))
throw std::invalid_argument("concat0: shape " + a.shape_str() + " vs " + b.shape_str());
std::vector<int64_t> shape = a.shape();
shape[0] += b.dim(0);
Tensor out = Tensor::empty(shape, DType::F32);
std::memcpy(out.f32(), a.f32(), a.nbytes());
std::memcpy(out.f32() + a.numel(), b.f32(), b.nbytes());
autograd::record(out, "concat0", {&a, &b}, [sa = a.shape(), sb = b.shape()](const Tensor& g) {
Tensor ga = Tensor::empty(sa, DType::F32);
Tensor gb = Tensor::empty(sb, DType::F32);
std::memcpy(ga.f32(), g.f32(), ga.nbytes());
std::memcpy(gb.f32(), g.f32() + ga.numel(), gb.nbytes());
return std::vector<Tensor>{ga, gb};
});
return out;
}


Tensor narrow0(const Tensor& x, int64_t start, int64_t length){
require_f32(x, "narrow0");
if (x.ndim() == 0 || start < 0 || length < 0 || start + length > x.dim(0))
throw std::out_of_range("narrow0: rows [" + std::to_string(start) + ", " + std::to_string(start + length) +
") outside " + x.shape_str());
const int64_t row = x.dim(0) ? x.numel()/x.dim(0) : 0;
std::vector<int64_t> shape = x.shape();
shape[0] = length;
Tensor out = Tensor::empty(shape, DType::F32);
std::memcpy(out.f32(), x.f32() + start*row, out.nbytes());
autograd::record(out, "narrow0", {&x}, [sx = x.shape(), start, row](const Tensor& g) {
Tensor gx = Tensor::zeros(sx, DType::F32);
std::memcpy(gx.f32() + start*row, g.f32(), g.nbytes());
return std::vector<Tensor>{gx};
});
return out;
}


Tensor rel_attention(const Tensor& q, const Tensor& k, const Tensor& v, const Tensor& pos,
const Tensor& u, const Tensor& r, int64_t mem_len,
float dropout_p, bool training, std::mt19937& rng){
for (const Tensor* t : {&q, &k, &v, &pos, &u, &r}) require_f32(*t, "rel_attention");
if (q.ndim() != 4 || k.ndim() != 4) throw std::invalid_argument("rel_attention: q/k/v must be [T, B, H, D]");
require_same_shape(k, v, "rel_attention");
const int64_t T = q.dim(0), B = q.dim(1), H = q.dim(2), D = q.dim(3);
const int64_t L = k.dim(0);
if (k.dim(1) != B || k.dim(2) != H || k.dim(3) != D || L != mem_len + T)
throw std::invalid_argument("rel_attention: keys " + k.shape_str() + " do not match queries " + q.shape_str() +
" with memory " + std::to_string(mem_len));
if (pos.ndim() != 2 || pos.dim(1) != H*D || pos.dim(0) < 1)
throw std::invalid_argument("rel_attention: position table must be [P, " + std::to_string(H*D) + "]");
if (u.numel() != H*D || r.numel() != H*D)
throw std::invalid_argument("rel_attention: biases must be [H, D]");
const int64_t P = pos.dim(0);
const float scale = 1.f/std::sqrt((float)D);
const bool use_dropout = training && dropout_p > 0.f;
if (dropout_p >= 1.f) throw std::invalid_argument("rel_attention: dropout probability must be < 1");

Tensor out = Tensor::zeros({T, B, H, D}, DType::F32);
Tensor probs = Tensor::zeros({B, H, T, L}, DType::F32);
Tensor mask = use_dropout ? Tensor::zeros({B, H, T, L}, DType::F32) : Tensor();
std::bernoulli_distribution keep(1.0 - dropout_p);
const float keep_scale = use_dropout ? 1.f/(1.f - dropout_p) : 1.f;

const float* pq = q.f32();
const float* pk = k.f32();
const float* pv = v.f32();
const float* pp = pos.f32();
const float* pu = u.f32();
const float* pr = r.f32();
float* po = out.f32();
float* pa = probs.f32();
float* pm = use_dropout ? mask.f32() : nullptr;
std::vector<float> s(L);

for (int64_t b = 0; b < B; ++b)
for (int64_t h = 0; h < H; ++h)
for (int64_t i = 0; i < T; ++i) {
const float* qi = pq + ((i*B + b)*H + h)*D;
const int64_t last = mem_len + i;
float mx = -std::numeric_limits<float>::infinity();
for (int64_t j = 0; j <= last; ++j) {
const float* kj = pk + ((j*B + b)*H + h)*D;
const float* pd = pp + std::min(last - j, P - 1)*H*D + h*D;
float acc = 0.f;
for (int64_t d = 0; d < D; ++d)
acc += (qi[d] + pu[h*D + d])*kj[d] + (qi[d] + pr[h*D + d])*pd[d];
s[j] = acc*scale;
mx = std::max(mx, s[j]);
}
float sum = 0.f;
for (int64_t j = 0; j <= last; ++j) { s[j] = std::exp(s[j] - mx); sum += s[j]; }
float* arow = pa + ((b*H + h)*T + i)*L;
float* mrow = pm ? pm + ((b*H + h)*T + i)*L : nullptr;
float* oi = po + ((i*B + b)*H + h)*D;
for (int64_t j = 0; j <= last; ++j) {
arow[j] = s[j]/sum;
float a = arow[j];
if (mrow) { mrow[j] = keep(rng) ? keep_scale : 0.f; a *= mrow[j]; }
const float* vj = pv + ((j*B + b)*H + h)*D;
for (int64_t d = 0; d < D; ++d) oi[d] += a*vj[d];
}
}

autograd::record(out, "rel_attention", {&q, &k, &v, &pos, &u, &r},
[q, k, v, pos, u, r, probs, mask, mem_len, scale](const Tensor& g) {
const int64_t T = q.dim(0), B = q.dim(1), H = q.dim(2), D = q.dim(3);
const int64_t L = k.dim(0), P = pos.dim(0);
Tensor gq = Tensor::zeros(q.shape(), DType::F32);
Tensor gk = Tensor::zeros(k.shape(), DType::F32);
Tensor gv = Tensor::zeros(v.shape(), DType::F32);
Tensor gpos = Tensor::zeros(pos.shape(), DType::F32);
Tensor gu = Tensor::zeros(u.shape(), DType::F32);
Tensor gr = Tensor::zeros(r.shape(), DType::F32);
const float* pq = q.f32();
const float* pk = k.f32();
const float* pv = v.f32();
const float* pp = pos.f32();
const float* pu = u.f32();
const float* pr = r.f32();
const float* pa = probs.f32();
const float* pm = mask.defined() ? mask.f32() : nullptr;
const float* gy = g.f32();
float* pgq = gq.f32();
float* pgk = gk.f32();
float* pgv = gv.f32();
float* pgp = gpos.f32();
float* pgu = gu.f32();
float* pgr = gr.f32();
std::vector<float> ga(L);

for (int64_t b = 0; b < B; ++b)
for (int64_t h = 0; h < H; ++h)
for (int64_t i = 0; i < T; ++i) {
const int64_t qoff = ((i*B + b)*H + h)*D;
const float* qi = pq + qoff;
const float* gi = gy + qoff;
const float* arow = pa + ((b*H + h)*T + i)*L;
const float* mrow = pm ? pm + ((b*H + h)*T + i)*L : nullptr;
const int64_t last = mem_len + i;
float dot = 0.f;
for (int64_t j = 0; j <= last; ++j) {
const int64_t koff = ((j*B + b)*H + h)*D;
const float m = mrow ? mrow[j] : 1.f;
float acc = 0.f;
for (int64_t d = 0; d < D; ++d) {
acc += gi[d]*pv[koff + d];
pgv[koff + d] += arow[j]*m*gi[d];
}
ga[j] = acc*m;
dot += arow[j]*ga[j];
}
for (int64_t j = 0; j <= last; ++j) {
const float gs = arow[j]*(ga[j] - dot)*scale;
if (gs == 0.f) continue;
const int64_t koff = ((j*B + b)*H + h)*D;
const int64_t poff = std::min(last - j, P - 1)*H*D + h*D;
for (int64_t d = 0; d < D; ++d) {
pgq[qoff + d] += gs*(pk[koff + d] + pp[poff + d]);
pgu[h*D + d] += gs*pk[koff + d];
pgr[h*D + d] += gs*pp[poff + d];
pgk[koff + d] += gs*(qi[d] + pu[h*D + d]);
pgp[poff + d] += gs*(qi[d] + pr[h*D + d]);
}
}
}
return std::vector<Tensor>{gq, gk, gv, gpos, gu, gr};
});
return out;
}


Tensor sum(const Tensor& x){
require_f32(x, "sum");
Tensor out = Tensor::zeros({1}, DType::F32);
const float* px = x.f32();
double acc = 0.0;
for (int64_t i = 0; i < x.numel(); ++i) acc += px[i];
out.f32()[0] = (float)acc;
autograd::record(out, "sum", {&x}, [shape = x.shape()](const Tensor& g) {
return std::vector<Tensor>{Tensor::full(shape, g.f32()[0])};
});
return out;
}


Tensor cross_entropy(const Tensor& logits, const Tensor& targets){
require_f32(logits, "cross_entropy");
if (!targets.defined() || targets.desc().dtype != DType::I32)
throw std::invalid_argument("cross_entropy: targets must be an i32 tensor");
const int64_t V = last_dim(logits, "cross_entropy");
const int64_t N = V ? logits.numel()/V : 0;
if (targets.numel() != N || N == 0)
throw std::invalid_argument("cross_entropy: " + std::to_string(targets.numel()) + " targets for " +
std::to_string(N) + " rows");
Tensor sm = Tensor::empty({N, V}, DType::F32);
const float* px = logits.f32();
const int32_t* pt = targets.i32();
float* ps = sm.f32();
double loss = 0.0;
for (int64_t n = 0; n < N; ++n) {
const int32_t t = pt[n];
if (t < 0 || t >= V)
throw std::out_of_range("cross_entropy: target " + std::to_string(t) + " outside [0, " + std::to_string(V) + ")");
const float* row = px + n*V;
const float mx = *std::max_element(row, row + V);
double z = 0.0;
for (int64_t c = 0; c < V; ++c) { ps[n*V + c] = std::exp(row[c] - mx); z += ps[n*V + c]; }
for (int64_t c = 0; c < V; ++c) ps[n*V + c] = (float)(ps[n*V + c]/z);
loss += -(row[t] - mx - std::log(z));
}
Tensor out = Tensor::zeros({1}, DType::F32);
out.f32()[0] = (float)(loss/(double)N);
autograd::record(out, "cross_entropy", {&logits}, [sm, targets, shape = logits.shape(), N, V](const Tensor& g) {
Tensor gx = Tensor::empty(shape, DType::F32);
const float scale = g.f32()[0]/(float)N;
const float* ps = sm.f32();
const int32_t* pt = targets.i32();
float* p = gx.f32();
for (int64_t n = 0; n < N; ++n)
for (int64_t c = 0; c < V; ++c)
p[n*V + c] = (ps[n*V + c] - (c == pt[n] ? 1.f : 0.f))*scale;
return std::vector<Tensor>{gx};
});
return out;
}


} // namespace ops
} // namespace txl
