#include <blockflow/kernels/lane_kernels.h>

#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numbers>

namespace blockflow::kernels {

namespace {

constexpr lane_value_t PI = std::numbers::pi_v<lane_value_t>;
constexpr lane_value_t LN2 = std::numbers::ln2_v<lane_value_t>;
constexpr lane_value_t LN10 = std::numbers::ln10_v<lane_value_t>;

template<typename F>
inline void map_lanes(ConstLaneSpan x, LaneSpan output, F f) {
    const auto *__restrict in = x.data();
    auto *__restrict out = output.data();
    for (std::size_t i = 0, n = output.size(); i < n; ++i) { out[i] = f(in[i]); }
}

template<typename F>
inline void map_lanes(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output, F f) {
    const auto *__restrict lhs = a.data();
    const auto *__restrict rhs = b.data();
    auto *__restrict out = output.data();
    for (std::size_t i = 0, n = output.size(); i < n; ++i) { out[i] = f(lhs[i], rhs[i]); }
}

template<typename F>
inline void map_lanes(ConstLaneSpan a, ConstLaneSpan b, ConstLaneSpan c, LaneSpan output, F f) {
    const auto *__restrict x = a.data();
    const auto *__restrict y = b.data();
    const auto *__restrict z = c.data();
    auto *__restrict out = output.data();
    for (std::size_t i = 0, n = output.size(); i < n; ++i) { out[i] = f(x[i], y[i], z[i]); }
}

inline lane_value_t quiet_nan() noexcept { return std::numeric_limits<lane_value_t>::quiet_NaN(); }

} // namespace

// ========== Lane-level helpers ==========

lane_value_t ieee_min(lane_value_t a, lane_value_t b) noexcept {
    if (std::isnan(a) || std::isnan(b)) { return quiet_nan(); }
    if (a == b) { return std::signbit(a) ? a : b; }
    return a < b ? a : b;
}

lane_value_t ieee_max(lane_value_t a, lane_value_t b) noexcept {
    if (std::isnan(a) || std::isnan(b)) { return quiet_nan(); }
    if (a == b) { return std::signbit(a) ? b : a; }
    return a > b ? a : b;
}

lane_value_t min_magnitude(lane_value_t a, lane_value_t b) noexcept {
    const auto abs_a = std::fabs(a);
    const auto abs_b = std::fabs(b);
    if (abs_a < abs_b || std::isnan(abs_a)) { return a; }
    if (abs_a == abs_b) { return std::signbit(a) ? a : b; }
    return b;
}

lane_value_t max_magnitude(lane_value_t a, lane_value_t b) noexcept {
    const auto abs_a = std::fabs(a);
    const auto abs_b = std::fabs(b);
    if (abs_a > abs_b || std::isnan(abs_a)) { return a; }
    if (abs_a == abs_b) { return std::signbit(a) ? b : a; }
    return b;
}

lane_value_t min_magnitude_number(lane_value_t a, lane_value_t b) noexcept {
    const auto abs_a = std::fabs(a);
    const auto abs_b = std::fabs(b);
    if (abs_a < abs_b || std::isnan(abs_b)) { return a; }
    if (abs_a == abs_b) { return std::signbit(a) ? a : b; }
    return b;
}

lane_value_t max_magnitude_number(lane_value_t a, lane_value_t b) noexcept {
    const auto abs_a = std::fabs(a);
    const auto abs_b = std::fabs(b);
    if (abs_a > abs_b || std::isnan(abs_b)) { return a; }
    if (abs_a == abs_b) { return std::signbit(a) ? b : a; }
    return b;
}

// ========== Unary ==========

void asinh(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return std::asinh(v); });
}

void asin_pi(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return std::asin(v) / PI; });
}

void atan(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return std::atan(v); });
}

void atan_pi(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return std::atan(v) / PI; });
}

void exp(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return std::exp(v); });
}

void exp2_m1(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return std::expm1(v * LN2); });
}

void exp10_m1(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return std::expm1(v * LN10); });
}

void floor(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return std::floor(v); });
}

void log10(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return std::log10(v); });
}

void log10_p1(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return std::log1p(v) / LN10; });
}

void reciprocal_sqrt(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return 1.0f / std::sqrt(v); });
}

void round(ConstLaneSpan x, LaneSpan output) {
    // nearbyint honours the default round-to-nearest-even mode without raising FE_INEXACT
    map_lanes(x, output, [](lane_value_t v) { return std::nearbyint(v); });
}

void sigmoid(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return 1.0f / (1.0f + std::exp(-v)); });
}

void sin_pi(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) {
        // Reduce to [-1, 1] first so whole numbers land exactly on a zero of the sine, signed like v
        const auto r = std::remainder(v, 2.0f);
        if (r == std::trunc(r)) { return std::copysign(0.0f, v); }
        return std::sin(PI * r);
    });
}

void softmax(ConstLaneSpan x, LaneSpan output) {
    if (output.empty()) { return; }
    auto peak = x[0];
    for (auto v : x) { peak = std::fmax(peak, v); }
    lane_value_t total = 0.0f;
    for (std::size_t i = 0; i < output.size(); ++i) {
        output[i] = std::exp(x[i] - peak);
        total += output[i];
    }
    for (auto &v : output) { v /= total; }
}

void truncate(ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [](lane_value_t v) { return std::trunc(v); });
}

// ========== Binary ==========

void add(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) {
    map_lanes(a, b, output, [](lane_value_t l, lane_value_t r) { return l + r; });
}

void subtract(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) {
    map_lanes(a, b, output, [](lane_value_t l, lane_value_t r) { return l - r; });
}

void multiply(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) {
    map_lanes(a, b, output, [](lane_value_t l, lane_value_t r) { return l * r; });
}

void divide(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) {
    map_lanes(a, b, output, [](lane_value_t l, lane_value_t r) { return l / r; });
}

void min(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) { map_lanes(a, b, output, ieee_min); }

void max(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) { map_lanes(a, b, output, ieee_max); }

void min_magnitude(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) {
    map_lanes(a, b, output, [](lane_value_t l, lane_value_t r) { return min_magnitude(l, r); });
}

void max_magnitude(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) {
    map_lanes(a, b, output, [](lane_value_t l, lane_value_t r) { return max_magnitude(l, r); });
}

void min_magnitude_number(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) {
    map_lanes(a, b, output, [](lane_value_t l, lane_value_t r) { return min_magnitude_number(l, r); });
}

void max_magnitude_number(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) {
    map_lanes(a, b, output, [](lane_value_t l, lane_value_t r) { return max_magnitude_number(l, r); });
}

void bitwise_and(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) {
    map_lanes(a, b, output, [](lane_value_t l, lane_value_t r) {
        return std::bit_cast<lane_value_t>(std::bit_cast<uint32_t>(l) & std::bit_cast<uint32_t>(r));
    });
}

void bitwise_or(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output) {
    map_lanes(a, b, output, [](lane_value_t l, lane_value_t r) {
        return std::bit_cast<lane_value_t>(std::bit_cast<uint32_t>(l) | std::bit_cast<uint32_t>(r));
    });
}

// ========== Ternary ==========

void fused_multiply_add(ConstLaneSpan x, ConstLaneSpan y, ConstLaneSpan addend, LaneSpan output) {
    map_lanes(x, y, addend, output, [](lane_value_t a, lane_value_t b, lane_value_t c) { return std::fma(a, b, c); });
}

void multiply_add(ConstLaneSpan x, ConstLaneSpan y, ConstLaneSpan addend, LaneSpan output) {
    map_lanes(x, y, addend, output, [](lane_value_t a, lane_value_t b, lane_value_t c) {
        const lane_value_t product = a * b;
        return product + c;
    });
}

void multiply_add_estimate(ConstLaneSpan x, ConstLaneSpan y, ConstLaneSpan addend, LaneSpan output) {
#if defined(__FMA__) || defined(__ARM_FEATURE_FMA)
    fused_multiply_add(x, y, addend, output);
#else
    multiply_add(x, y, addend, output);
#endif
}

void add_multiply(ConstLaneSpan x, ConstLaneSpan y, ConstLaneSpan multiplier, LaneSpan output) {
    map_lanes(x, y, multiplier, output, [](lane_value_t a, lane_value_t b, lane_value_t m) { return (a + b) * m; });
}

// ========== Block and scalar ==========

void add(ConstLaneSpan x, lane_value_t s, LaneSpan output) {
    map_lanes(x, output, [s](lane_value_t v) { return v + s; });
}

void subtract(ConstLaneSpan x, lane_value_t s, LaneSpan output) {
    map_lanes(x, output, [s](lane_value_t v) { return v - s; });
}

void subtract(lane_value_t s, ConstLaneSpan x, LaneSpan output) {
    map_lanes(x, output, [s](lane_value_t v) { return s - v; });
}

void multiply(ConstLaneSpan x, lane_value_t s, LaneSpan output) {
    map_lanes(x, output, [s](lane_value_t v) { return v * s; });
}

void divide(ConstLaneSpan x, lane_value_t s, LaneSpan output) {
    map_lanes(x, output, [s](lane_value_t v) { return v / s; });
}

void max(ConstLaneSpan x, lane_value_t s, LaneSpan output) {
    map_lanes(x, output, [s](lane_value_t v) { return ieee_max(v, s); });
}

void max_magnitude(ConstLaneSpan x, lane_value_t s, LaneSpan output) {
    map_lanes(x, output, [s](lane_value_t v) { return max_magnitude(v, s); });
}

// ========== Two blocks and scalar ==========

void add_multiply(ConstLaneSpan x, ConstLaneSpan y, lane_value_t multiplier, LaneSpan output) {
    map_lanes(x, y, output, [multiplier](lane_value_t a, lane_value_t b) { return (a + b) * multiplier; });
}

void add_multiply(ConstLaneSpan x, lane_value_t y, ConstLaneSpan multiplier, LaneSpan output) {
    map_lanes(x, multiplier, output, [y](lane_value_t a, lane_value_t m) { return (a + y) * m; });
}

void multiply_add(ConstLaneSpan x, ConstLaneSpan y, lane_value_t addend, LaneSpan output) {
    map_lanes(x, y, output, [addend](lane_value_t a, lane_value_t b) {
        const lane_value_t product = a * b;
        return product + addend;
    });
}

void multiply_add(ConstLaneSpan x, lane_value_t y, ConstLaneSpan addend, LaneSpan output) {
    map_lanes(x, addend, output, [y](lane_value_t a, lane_value_t c) {
        const lane_value_t product = a * y;
        return product + c;
    });
}

void fused_multiply_add(ConstLaneSpan x, ConstLaneSpan y, lane_value_t addend, LaneSpan output) {
    map_lanes(x, y, output, [addend](lane_value_t a, lane_value_t b) { return std::fma(a, b, addend); });
}

void fused_multiply_add(ConstLaneSpan x, lane_value_t y, ConstLaneSpan addend, LaneSpan output) {
    map_lanes(x, addend, output, [y](lane_value_t a, lane_value_t c) { return std::fma(a, y, c); });
}

void multiply_add_estimate(ConstLaneSpan x, ConstLaneSpan y, lane_value_t addend, LaneSpan output) {
#if defined(__FMA__) || defined(__ARM_FEATURE_FMA)
    fused_multiply_add(x, y, addend, output);
#else
    multiply_add(x, y, addend, output);
#endif
}

void multiply_add_estimate(ConstLaneSpan x, lane_value_t y, ConstLaneSpan addend, LaneSpan output) {
#if defined(__FMA__) || defined(__ARM_FEATURE_FMA)
    fused_multiply_add(x, y, addend, output);
#else
    multiply_add(x, y, addend, output);
#endif
}

} // namespace blockflow::kernels
