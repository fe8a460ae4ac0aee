#pragma once

/**
 * @file lane_kernels.h
 * @brief Pure, allocation-free per-block kernels.
 *
 * Every kernel reads one to three lane spans (and optionally one scalar) and writes exactly output.size() lanes.
 * All spans passed to a kernel have the same length. Kernels hold no state and touch nothing outside their
 * arguments, which is what lets the compiler turn each loop into straight vector code.
 *
 * Min / max follow IEEE 754-2019 semantics: NaN propagates, -0 orders below +0. The *_magnitude kernels
 * compare absolute values (NaN propagates), the *_magnitude_number kernels ignore a NaN operand.
 */

#include <blockflow/blockflow_base.h>

namespace blockflow::kernels {

// ========== Unary ==========

BLOCKFLOW_EXPORT void asinh(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void asin_pi(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void atan(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void atan_pi(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void exp(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void exp2_m1(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void exp10_m1(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void floor(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void log10(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void log10_p1(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void reciprocal_sqrt(ConstLaneSpan x, LaneSpan output);
// Half-way cases round to even.
BLOCKFLOW_EXPORT void round(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void sigmoid(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void sin_pi(ConstLaneSpan x, LaneSpan output);
// Normalised across the lanes of the block.
BLOCKFLOW_EXPORT void softmax(ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void truncate(ConstLaneSpan x, LaneSpan output);

// ========== Binary ==========

BLOCKFLOW_EXPORT void add(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output);
BLOCKFLOW_EXPORT void subtract(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output);
BLOCKFLOW_EXPORT void multiply(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output);
BLOCKFLOW_EXPORT void divide(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output);
BLOCKFLOW_EXPORT void min(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output);
BLOCKFLOW_EXPORT void max(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output);
BLOCKFLOW_EXPORT void min_magnitude(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output);
BLOCKFLOW_EXPORT void max_magnitude(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output);
BLOCKFLOW_EXPORT void min_magnitude_number(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output);
BLOCKFLOW_EXPORT void max_magnitude_number(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output);
// Operate on the IEEE bit patterns.
BLOCKFLOW_EXPORT void bitwise_and(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output);
BLOCKFLOW_EXPORT void bitwise_or(ConstLaneSpan a, ConstLaneSpan b, LaneSpan output);

// ========== Ternary ==========

// x * y + addend with a single rounding
BLOCKFLOW_EXPORT void fused_multiply_add(ConstLaneSpan x, ConstLaneSpan y, ConstLaneSpan addend, LaneSpan output);
// x * y + addend, rounded after the multiply
BLOCKFLOW_EXPORT void multiply_add(ConstLaneSpan x, ConstLaneSpan y, ConstLaneSpan addend, LaneSpan output);
// x * y + addend, fused or not, whichever the target does fastest
BLOCKFLOW_EXPORT void multiply_add_estimate(ConstLaneSpan x, ConstLaneSpan y, ConstLaneSpan addend, LaneSpan output);
// (x + y) * multiplier
BLOCKFLOW_EXPORT void add_multiply(ConstLaneSpan x, ConstLaneSpan y, ConstLaneSpan multiplier, LaneSpan output);

// ========== Block and scalar ==========

BLOCKFLOW_EXPORT void add(ConstLaneSpan x, lane_value_t s, LaneSpan output);
BLOCKFLOW_EXPORT void subtract(ConstLaneSpan x, lane_value_t s, LaneSpan output);
BLOCKFLOW_EXPORT void subtract(lane_value_t s, ConstLaneSpan x, LaneSpan output);
BLOCKFLOW_EXPORT void multiply(ConstLaneSpan x, lane_value_t s, LaneSpan output);
BLOCKFLOW_EXPORT void divide(ConstLaneSpan x, lane_value_t s, LaneSpan output);
BLOCKFLOW_EXPORT void max(ConstLaneSpan x, lane_value_t s, LaneSpan output);
BLOCKFLOW_EXPORT void max_magnitude(ConstLaneSpan x, lane_value_t s, LaneSpan output);

// ========== Two blocks and scalar ==========

BLOCKFLOW_EXPORT void add_multiply(ConstLaneSpan x, ConstLaneSpan y, lane_value_t multiplier, LaneSpan output);
BLOCKFLOW_EXPORT void add_multiply(ConstLaneSpan x, lane_value_t y, ConstLaneSpan multiplier, LaneSpan output);
BLOCKFLOW_EXPORT void multiply_add(ConstLaneSpan x, ConstLaneSpan y, lane_value_t addend, LaneSpan output);
BLOCKFLOW_EXPORT void multiply_add(ConstLaneSpan x, lane_value_t y, ConstLaneSpan addend, LaneSpan output);
BLOCKFLOW_EXPORT void fused_multiply_add(ConstLaneSpan x, ConstLaneSpan y, lane_value_t addend, LaneSpan output);
BLOCKFLOW_EXPORT void fused_multiply_add(ConstLaneSpan x, lane_value_t y, ConstLaneSpan addend, LaneSpan output);
BLOCKFLOW_EXPORT void multiply_add_estimate(ConstLaneSpan x, ConstLaneSpan y, lane_value_t addend, LaneSpan output);
BLOCKFLOW_EXPORT void multiply_add_estimate(ConstLaneSpan x, lane_value_t y, ConstLaneSpan addend, LaneSpan output);

// ========== Lane-level helpers ==========

[[nodiscard]] BLOCKFLOW_EXPORT lane_value_t ieee_min(lane_value_t a, lane_value_t b) noexcept;
[[nodiscard]] BLOCKFLOW_EXPORT lane_value_t ieee_max(lane_value_t a, lane_value_t b) noexcept;
[[nodiscard]] BLOCKFLOW_EXPORT lane_value_t min_magnitude(lane_value_t a, lane_value_t b) noexcept;
[[nodiscard]] BLOCKFLOW_EXPORT lane_value_t max_magnitude(lane_value_t a, lane_value_t b) noexcept;
[[nodiscard]] BLOCKFLOW_EXPORT lane_value_t min_magnitude_number(lane_value_t a, lane_value_t b) noexcept;
[[nodiscard]] BLOCKFLOW_EXPORT lane_value_t max_magnitude_number(lane_value_t a, lane_value_t b) noexcept;

} // namespace blockflow::kernels
