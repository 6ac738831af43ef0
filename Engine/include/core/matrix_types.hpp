#pragma once

#include <Eigen/Core>
#include <cstdint>

namespace Engram {

// p x n, one row per hard location, entries 0/1
using AddressMatrix = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// p x n signed write counters, row-major so a row is one location
using CounterMatrix = Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// 1 x n read accumulator
using Accumulator = Eigen::Matrix<int64_t, 1, Eigen::Dynamic>;

} // namespace Engram
