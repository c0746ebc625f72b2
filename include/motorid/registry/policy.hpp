#pragma once

#include <datapod/datapod.hpp>
#include <motorid/common/error.hpp>
#include <motorid/registry/state.hpp>
#include <string>

namespace motorid::policy {

    /// Guard outcome: ok, or the first violated rule with its reason code
    using Check = dp::Result<void, dp::Error>;

    inline Check pass() { return Check::ok(); }

    // === Input shape ===

    Check requireNonEmpty(const std::string &value, const std::string &field);

    Check requireNonNull(const Address &address, const std::string &field);

    // === Principal state ===

    /// AuthorizationError when the address has no registered principal
    Check requireRegistered(const RegistryState &state, const Address &address);

    /// ConflictError when the address already has a principal
    Check requireUnregistered(const RegistryState &state, const Address &address);

    /// The address must be a registered principal holding `role`
    /// `failure` selects the reported kind: Authorization for a caller lacking the role,
    /// Validation where an action target (or, for policies, the insurer) has the wrong role.
    Check requireRole(const RegistryState &state, const Address &address, Role role,
                      ErrorKind failure = ErrorKind::Authorization);

    // === Vehicle state ===

    /// NotFoundError for an unknown VIN, AuthorizationError when address is not the owner
    Check requireVehicleOwner(const RegistryState &state, const Address &address, const std::string &vin);

    /// AuthorizationError unless (vin, address) was granted
    Check requireMechanicAuthorized(const RegistryState &state, const std::string &vin, const Address &address);

    // === DID state ===

    /// ConflictError when the DID is already bound to a principal, unit or vehicle
    Check requireUnbound(const RegistryState &state, const std::string &did);

    /// ValidationError unless the DID is registered and not revoked
    Check requireValidDID(const RegistryState &state, const std::string &did);

    /// ValidationError unless the identifier names a registered vehicle (VIN or vehicle DID)
    /// or a principal DID; with `allow_units`, the DID of an active roadside unit also counts
    Check requireResolvable(const RegistryState &state, const std::string &identifier, bool allow_units,
                            const std::string &field);

    /// AuthorizationError when the DID document has a controller other than `address`
    Check requireController(const RegistryState &state, const std::string &did, const Address &address);

} // namespace motorid::policy
