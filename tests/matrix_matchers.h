#ifndef PHYLOTRAITS_MATRIX_MATCHERS_H_
#define PHYLOTRAITS_MATRIX_MATCHERS_H_

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <Eigen/Dense>

namespace phylotraits {

// Element-wise comparison of two Eigen matrices (or vectors) of the same shape
MATCHER_P2(matrix_double_near, expected, tolerance, "") {
  if (arg.rows() != expected.rows() || arg.cols() != expected.cols()) {
    *result_listener << "which has shape " << arg.rows() << "x" << arg.cols()
                     << " instead of " << expected.rows() << "x" << expected.cols();
    return false;
  }
  auto result = true;
  for (auto i = 0; i != arg.rows(); ++i) {
    for (auto j = 0; j != arg.cols(); ++j) {
      if (not ExplainMatchResult(testing::DoubleNear(expected(i, j), tolerance), arg(i, j), result_listener)) {
        *result_listener << " at (" << i << ", " << j << ")";
        result = false;
      }
    }
  }
  return result;
}

MATCHER_P(pointwise_double_near, tolerance, "") {
  const auto& [v_actual, v_expected] = arg;
  return ExplainMatchResult(testing::DoubleNear(v_expected, tolerance), v_actual, result_listener);
}

}  // namespace phylotraits

#endif // PHYLOTRAITS_MATRIX_MATCHERS_H_
