/**
 * @file first_fit_policy.cpp
 * @brief FirstFitPolicy implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/first_fit_policy.hpp"

namespace kubesim {

std::optional<size_t> FirstFitPolicy::select(const Resources& request,
                                             const std::vector<NodeCapacity>& nodes) const {
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (request.fits_within(nodes[i].free)) {
            return i;
        }
    }
    return std::nullopt;
}

}  // namespace kubesim
