/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for kubesim interfaces.
 * @author Dimitris Kafetzis
 *
 * Compile-time interface constraints for components that are also used
 * with static dispatch (planning benchmarks, policy unit tests).
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace kubesim {

// Forward declarations
struct NodeCapacity;

// ─────────────────────────────────────────────
// PlacementPolicyLike
// ─────────────────────────────────────────────

/**
 * @concept PlacementPolicyLike
 * @brief Constrains types that pick a node for a resource request.
 *
 * Satisfied by every IPlacementPolicy implementation and by the interface
 * itself, so plan_placements() works with either a concrete policy or a
 * type-erased one.
 */
template <typename T>
concept PlacementPolicyLike = requires(
    const T& policy,
    const Resources& request,
    const std::vector<NodeCapacity>& nodes
) {
    { policy.select(request, nodes) } -> std::same_as<std::optional<size_t>>;
    { policy.name() } -> std::convertible_to<std::string_view>;
};

}  // namespace kubesim
