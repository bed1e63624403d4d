#include "statistics.h"

#include <cmath>
#include <limits>

#include <Eigen/Core>

namespace ef::stats {

double mean(const std::vector<double>& values)
{
    if (values.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    const Eigen::Map<const Eigen::ArrayXd> arr{
        values.data(), static_cast<Eigen::Index>(values.size())};
    return arr.mean();
}

double stddev(const std::vector<double>& values)
{
    if (values.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    const Eigen::Map<const Eigen::ArrayXd> arr{
        values.data(), static_cast<Eigen::Index>(values.size())};
    return std::sqrt((arr - arr.mean()).square().mean());
}

} // namespace ef::stats
