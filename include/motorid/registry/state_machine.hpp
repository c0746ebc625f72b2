#pragma once

#include <datapod/datapod.hpp>
#include <motorid/registry/event.hpp>
#include <motorid/registry/operation.hpp>
#include <motorid/registry/policy.hpp>
#include <motorid/registry/state.hpp>
#include <vector>

namespace motorid {

    // ===========================================
    // State transition
    // ===========================================

    /// Check an operation against the current state without touching it
    /// Returns the first violated rule; guards run in the documented order of each operation.
    policy::Check validate(const RegistryState &state, const Operation &op);

    /// Apply a validated operation and return the notifications it produces
    /// Must only be called after validate() succeeded on the same state. Applying cannot
    /// fail, so a committed operation is always applied completely.
    std::vector<RegistryEvent> apply(RegistryState &state, const Operation &op, dp::u64 sequence);

} // namespace motorid
