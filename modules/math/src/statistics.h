#pragma once

#include <vector>

namespace ef::stats {

// NaN for an empty input
double mean(const std::vector<double>& values);

// Population standard deviation (divides by N), NaN for an empty input
double stddev(const std::vector<double>& values);

} // namespace ef::stats
