#ifndef MULEGRAPH_GRAPH_FEATURE_MATH_HPP_
#define MULEGRAPH_GRAPH_FEATURE_MATH_HPP_

#include <cmath>
#include <cstddef>

namespace mulegraph {
namespace graph {

// Ratio features are published with four decimal places
constexpr int kFeaturePrecision = 4;

inline double roundToPlaces(double value, int places = kFeaturePrecision) {
  double scale = std::pow(10.0, places);
  return std::round(value * scale) / scale;
}

// numerator / denominator rounded, 0 when the denominator is 0
inline double safeRatio(std::size_t numerator, std::size_t denominator) {
  if (denominator == 0) return 0.0;
  return roundToPlaces(static_cast<double>(numerator) / static_cast<double>(denominator));
}

}  // namespace graph
}  // namespace mulegraph

#endif  // MULEGRAPH_GRAPH_FEATURE_MATH_HPP_
