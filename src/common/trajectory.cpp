#include "common/trajectory.hpp"
#include "common/errors.hpp"

namespace common {

auto subsample(const Trajectory& trajectory, std::size_t stride) -> Trajectory
{
    if (stride == 0) {
        throw ConfigurationError("Sampling stride must be positive");
    }

    Trajectory sampled;
    sampled.reserve(trajectory.size() / stride + 1);
    for (std::size_t k = 0; k < trajectory.size(); k += stride) {
        sampled.push_back(trajectory[k]);
    }
    return sampled;
}

} // namespace common
