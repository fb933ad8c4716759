/**
 * @file best_fit_policy.hpp
 * @brief Best-fit placement: the fitting node left with the least room.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "scheduler/scheduler.hpp"

namespace kubesim {

class BestFitPolicy : public IPlacementPolicy {
public:
    [[nodiscard]] std::optional<size_t> select(
        const Resources& request, const std::vector<NodeCapacity>& nodes) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "best_fit"; }
};

static_assert(PlacementPolicyLike<BestFitPolicy>);

}  // namespace kubesim
