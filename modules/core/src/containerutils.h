#pragma once

#include <algorithm>
#include <iterator>
#include <vector>

#include <glog/logging.h>

namespace ef::con {

template <typename T>
void Erase(std::vector<T>& vec, size_t index)
{
    CHECK_LT(index, vec.size());
    auto it = vec.begin();
    std::advance(it, index);
    vec.erase(it);
}

template <typename T>
void Insert(std::vector<T>& vec, size_t index, T value)
{
    CHECK_LE(index, vec.size());
    auto it = vec.begin();
    std::advance(it, index);
    vec.insert(it, std::move(value));
}

// Upper median: for even sizes the larger of the two middle elements is
// returned, no averaging.
template <typename T>
T FindUpperMedian(std::vector<T>& vec)
{
    CHECK(!vec.empty());
    const auto mid = vec.size() / 2;
    std::nth_element(vec.begin(), vec.begin() + mid, vec.end());
    return vec[mid];
}

template <typename T>
inline bool Contains(const std::vector<T>& vec, const T& val)
{
    return std::find(vec.cbegin(), vec.cend(), val) != vec.cend();
}

template <typename T>
inline int FindPos(const std::vector<T>& vec, const T& val)
{
    const auto found = std::find(vec.cbegin(), vec.cend(), val);
    if (found == vec.cend()) {
        return -1;
    }
    return static_cast<int>(std::distance(vec.cbegin(), found));
}

} // namespace ef::con
