#pragma once

#include "common/types.hpp"

#include <cstddef>

namespace common {

/// @brief Keep every stride-th record of a trajectory, starting with the first
/// @param trajectory Trajectory to sample
/// @param stride Sampling interval (records), must be positive
/// @return Sampled trajectory
auto subsample(const Trajectory& trajectory, std::size_t stride) -> Trajectory;

} // namespace common
