#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <blockflow/kernels/lane_kernels.h>

#include <array>
#include <cmath>
#include <limits>

using namespace blockflow;
using Catch::Approx;

namespace {
    using Lanes = std::array<lane_value_t, 4>;

    const lane_value_t NaN = std::numeric_limits<lane_value_t>::quiet_NaN();

    using UnaryKernel = void (*)(ConstLaneSpan, LaneSpan);
    using BinaryKernel = void (*)(ConstLaneSpan, ConstLaneSpan, LaneSpan);

    // Taking the kernel as a function pointer selects the block-block overload.
    Lanes apply(UnaryKernel kernel, const Lanes &x) {
        Lanes out{};
        kernel(ConstLaneSpan{x}, LaneSpan{out});
        return out;
    }

    Lanes apply(BinaryKernel kernel, const Lanes &a, const Lanes &b) {
        Lanes out{};
        kernel(ConstLaneSpan{a}, ConstLaneSpan{b}, LaneSpan{out});
        return out;
    }
}

// ============================================================================
// Unary
// ============================================================================

TEST_CASE("kernels - round half to even", "[kernels]") {
    auto out = apply(kernels::round, Lanes{0.5f, 1.5f, 2.5f, -2.5f});
    CHECK(out == Lanes{0.0f, 2.0f, 2.0f, -2.0f});
}

TEST_CASE("kernels - floor and truncate", "[kernels]") {
    CHECK(apply(kernels::floor, Lanes{-1.5f, 1.5f, 0.0f, -0.2f}) == Lanes{-2.0f, 1.0f, 0.0f, -1.0f});
    CHECK(apply(kernels::truncate, Lanes{-1.7f, 1.7f, 2.0f, -0.2f})[0] == -1.0f);
    CHECK(apply(kernels::truncate, Lanes{-1.7f, 1.7f, 2.0f, -0.2f})[1] == 1.0f);
}

TEST_CASE("kernels - pi scaled functions", "[kernels]") {
    auto sin = apply(kernels::sin_pi, Lanes{0.0f, 0.5f, 1.0f, -0.5f});
    CHECK(sin[0] == 0.0f);
    CHECK(sin[1] == Approx(1.0f));
    CHECK(sin[2] == 0.0f);
    CHECK(sin[3] == Approx(-1.0f));

    auto whole = apply(kernels::sin_pi, Lanes{3.0f, -3.0f, 2.0f, -0.0f});
    CHECK(whole[0] == 0.0f);
    CHECK_FALSE(std::signbit(whole[0]));
    CHECK(std::signbit(whole[1]));
    CHECK_FALSE(std::signbit(whole[2]));
    CHECK(std::signbit(whole[3]));

    auto asin = apply(kernels::asin_pi, Lanes{1.0f, -1.0f, 0.0f, 0.5f});
    CHECK(asin[0] == Approx(0.5f));
    CHECK(asin[1] == Approx(-0.5f));
    CHECK(asin[3] == Approx(1.0f / 6.0f));

    auto atan = apply(kernels::atan_pi, Lanes{1.0f, -1.0f, 0.0f, 0.0f});
    CHECK(atan[0] == Approx(0.25f));
    CHECK(atan[1] == Approx(-0.25f));
}

TEST_CASE("kernels - exponentials and logarithms", "[kernels]") {
    CHECK(apply(kernels::exp, Lanes{0.0f, 1.0f, 0.0f, 0.0f})[1] == Approx(2.7182817f));
    CHECK(apply(kernels::exp2_m1, Lanes{3.0f, 0.0f, 0.0f, 0.0f})[0] == Approx(7.0f));
    CHECK(apply(kernels::exp10_m1, Lanes{2.0f, 0.0f, 0.0f, 0.0f})[0] == Approx(99.0f));
    CHECK(apply(kernels::log10, Lanes{100.0f, 1.0f, 1.0f, 1.0f})[0] == Approx(2.0f));
    CHECK(apply(kernels::log10_p1, Lanes{9.0f, 0.0f, 0.0f, 0.0f})[0] == Approx(1.0f));
    CHECK(apply(kernels::reciprocal_sqrt, Lanes{4.0f, 1.0f, 1.0f, 1.0f})[0] == Approx(0.5f));
    CHECK(apply(kernels::asinh, Lanes{0.0f, 0.0f, 0.0f, 0.0f})[0] == 0.0f);
    CHECK(apply(kernels::atan, Lanes{0.0f, 0.0f, 0.0f, 0.0f})[0] == 0.0f);
}

TEST_CASE("kernels - sigmoid", "[kernels]") {
    auto out = apply(kernels::sigmoid, Lanes{0.0f, 100.0f, -100.0f, 0.0f});
    CHECK(out[0] == 0.5f);
    CHECK(out[1] == Approx(1.0f));
    CHECK(out[2] == Approx(0.0f).margin(1e-6));
}

TEST_CASE("kernels - softmax normalises across the block", "[kernels]") {
    auto uniform = apply(kernels::softmax, Lanes{1.0f, 1.0f, 1.0f, 1.0f});
    for (auto v : uniform) { CHECK(v == Approx(0.25f)); }

    // Shifting by the maximum keeps large inputs finite
    auto large = apply(kernels::softmax, Lanes{1000.0f, 1000.0f, 0.0f, 0.0f});
    CHECK(large[0] == Approx(0.5f));
    CHECK(large[2] == Approx(0.0f).margin(1e-6));
}

// ============================================================================
// Binary
// ============================================================================

TEST_CASE("kernels - arithmetic", "[kernels]") {
    Lanes a{6.0f, 1.0f, -2.0f, 0.5f};
    Lanes b{3.0f, 4.0f, 2.0f, 0.5f};
    CHECK(apply(kernels::add, a, b) == Lanes{9.0f, 5.0f, 0.0f, 1.0f});
    CHECK(apply(kernels::subtract, a, b) == Lanes{3.0f, -3.0f, -4.0f, 0.0f});
    CHECK(apply(kernels::multiply, a, b) == Lanes{18.0f, 4.0f, -4.0f, 0.25f});
    CHECK(apply(kernels::divide, a, b) == Lanes{2.0f, 0.25f, -1.0f, 1.0f});
}

TEST_CASE("kernels - min and max follow IEEE 754-2019", "[kernels]") {
    auto min = apply(kernels::min, Lanes{-0.0f, NaN, 1.0f, 3.0f}, Lanes{0.0f, 1.0f, NaN, 2.0f});
    CHECK(min[0] == 0.0f);
    CHECK(std::signbit(min[0]));
    CHECK(std::isnan(min[1]));
    CHECK(std::isnan(min[2]));
    CHECK(min[3] == 2.0f);

    auto max = apply(kernels::max, Lanes{-0.0f, NaN, 1.0f, 3.0f}, Lanes{0.0f, 1.0f, 1.0f, 2.0f});
    CHECK_FALSE(std::signbit(max[0]));
    CHECK(std::isnan(max[1]));
    CHECK(max[3] == 3.0f);
}

TEST_CASE("kernels - magnitude comparisons", "[kernels]") {
    Lanes a{-3.0f, -2.0f, NaN, 1.0f};
    Lanes b{2.0f, 2.0f, 3.0f, NaN};

    auto min_mag = apply(kernels::min_magnitude, a, b);
    CHECK(min_mag[0] == 2.0f);
    CHECK(min_mag[1] == -2.0f);
    CHECK(std::isnan(min_mag[2]));
    CHECK(std::isnan(min_mag[3]));

    auto max_mag = apply(kernels::max_magnitude, a, b);
    CHECK(max_mag[0] == -3.0f);
    CHECK(max_mag[1] == 2.0f);
    CHECK(std::isnan(max_mag[2]));

    auto min_mag_number = apply(kernels::min_magnitude_number, a, b);
    CHECK(min_mag_number[2] == 3.0f);
    CHECK(min_mag_number[3] == 1.0f);

    auto max_mag_number = apply(kernels::max_magnitude_number, a, b);
    CHECK(max_mag_number[0] == -3.0f);
    CHECK(max_mag_number[2] == 3.0f);
    CHECK(max_mag_number[3] == 1.0f);
}

TEST_CASE("kernels - bitwise operations act on the float representation", "[kernels]") {
    auto both = apply(kernels::bitwise_and, Lanes{1.0f, 0.0f, -2.0f, 3.0f}, Lanes{-1.0f, 5.0f, 2.0f, 3.0f});
    CHECK(both[0] == 1.0f);
    CHECK(both[1] == 0.0f);
    CHECK(both[2] == 2.0f);
    CHECK(both[3] == 3.0f);

    auto either = apply(kernels::bitwise_or, Lanes{1.0f, 0.0f, 2.0f, 3.0f}, Lanes{-1.0f, 5.0f, 2.0f, 3.0f});
    CHECK(either[0] == -1.0f);
    CHECK(either[1] == 5.0f);
}

// ============================================================================
// Ternary and scalar forms
// ============================================================================

TEST_CASE("kernels - multiply-add family", "[kernels]") {
    Lanes x{2.0f, 1.0f, 0.0f, -1.0f};
    Lanes y{3.0f, 1.0f, 5.0f, 2.0f};
    Lanes c{4.0f, 0.0f, 1.0f, 1.0f};
    Lanes out{};

    kernels::fused_multiply_add(x, y, c, out);
    CHECK(out == Lanes{10.0f, 1.0f, 1.0f, -1.0f});
    kernels::multiply_add(x, y, c, out);
    CHECK(out == Lanes{10.0f, 1.0f, 1.0f, -1.0f});
    kernels::multiply_add_estimate(x, y, c, out);
    CHECK(out == Lanes{10.0f, 1.0f, 1.0f, -1.0f});
    kernels::add_multiply(x, y, c, out);
    CHECK(out == Lanes{20.0f, 0.0f, 5.0f, 1.0f});

    kernels::multiply_add(x, 2.0f, c, out);
    CHECK(out == Lanes{8.0f, 2.0f, 1.0f, -1.0f});
    kernels::multiply_add(x, y, 1.0f, out);
    CHECK(out == Lanes{7.0f, 2.0f, 1.0f, -1.0f});
    kernels::add_multiply(x, 1.0f, c, out);
    CHECK(out == Lanes{12.0f, 0.0f, 1.0f, 0.0f});
    kernels::add_multiply(x, y, 2.0f, out);
    CHECK(out == Lanes{10.0f, 4.0f, 10.0f, 2.0f});
}

TEST_CASE("kernels - block and scalar", "[kernels]") {
    Lanes x{1.0f, -4.0f, 2.0f, 0.0f};
    Lanes out{};

    kernels::add(x, 5.0f, out);
    CHECK(out == Lanes{6.0f, 1.0f, 7.0f, 5.0f});
    kernels::subtract(x, 1.0f, out);
    CHECK(out == Lanes{0.0f, -5.0f, 1.0f, -1.0f});
    kernels::subtract(10.0f, x, out);
    CHECK(out == Lanes{9.0f, 14.0f, 8.0f, 10.0f});
    kernels::multiply(x, 3.0f, out);
    CHECK(out == Lanes{3.0f, -12.0f, 6.0f, 0.0f});
    kernels::divide(x, 2.0f, out);
    CHECK(out == Lanes{0.5f, -2.0f, 1.0f, 0.0f});
    kernels::max(x, 1.5f, out);
    CHECK(out == Lanes{1.5f, 1.5f, 2.0f, 1.5f});
    kernels::max_magnitude(x, 3.0f, out);
    CHECK(out == Lanes{3.0f, -4.0f, 3.0f, 3.0f});
}
