/**
 * @file first_fit_policy.hpp
 * @brief First-fit placement: first node in id order with room.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "scheduler/scheduler.hpp"

namespace kubesim {

class FirstFitPolicy : public IPlacementPolicy {
public:
    [[nodiscard]] std::optional<size_t> select(
        const Resources& request, const std::vector<NodeCapacity>& nodes) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "first_fit"; }
};

static_assert(PlacementPolicyLike<FirstFitPolicy>);

}  // namespace kubesim
