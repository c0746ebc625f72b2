#include <motorid/registry/policy.hpp>

namespace motorid::policy {

    Check requireNonEmpty(const std::string &value, const std::string &field) {
        if (value.empty())
            return Check::err(validation_error(ERR_EMPTY_FIELD, field + " must not be empty"));
        return pass();
    }

    Check requireNonNull(const Address &address, const std::string &field) {
        if (address.isNull())
            return Check::err(validation_error(ERR_NULL_ADDRESS, field + " must not be the null address"));
        return pass();
    }

    Check requireRegistered(const RegistryState &state, const Address &address) {
        if (!state.principals.isPrincipal(address))
            return Check::err(
                authorization_error(ERR_NOT_REGISTERED, "Address not registered: " + address.toString()));
        return pass();
    }

    Check requireUnregistered(const RegistryState &state, const Address &address) {
        if (state.principals.isPrincipal(address))
            return Check::err(
                conflict_error(ERR_ALREADY_REGISTERED, "Address already registered: " + address.toString()));
        return pass();
    }

    Check requireRole(const RegistryState &state, const Address &address, Role role, ErrorKind failure) {
        auto principal = state.principals.findPrincipal(address);
        if (principal != nullptr && principal->registered && principal->getRole() == role)
            return pass();

        std::string msg = address.toString() + " is not a registered " + roleToString(role);
        if (failure == ErrorKind::Validation)
            return Check::err(validation_error(ERR_INVALID_ROLE, msg));
        return Check::err(authorization_error(ERR_ROLE_REQUIRED, msg));
    }

    Check requireVehicleOwner(const RegistryState &state, const Address &address, const std::string &vin) {
        auto vehicle = state.vehicles.find(vin);
        if (vehicle == nullptr)
            return Check::err(not_found_error(ERR_VEHICLE_NOT_FOUND, "Vehicle not found: " + vin));
        if (vehicle->current_owner != address)
            return Check::err(authorization_error(ERR_NOT_VEHICLE_OWNER,
                                                  address.toString() + " is not the owner of vehicle " + vin));
        return pass();
    }

    Check requireMechanicAuthorized(const RegistryState &state, const std::string &vin, const Address &address) {
        if (!state.maintenance.isAuthorized(vin, address))
            return Check::err(authorization_error(ERR_MECHANIC_NOT_AUTHORIZED,
                                                  address.toString() + " is not authorized to service " + vin));
        return pass();
    }

    Check requireUnbound(const RegistryState &state, const std::string &did) {
        if (state.isBound(did))
            return Check::err(conflict_error(ERR_DID_ALREADY_BOUND, "DID already bound: " + did));
        return pass();
    }

    Check requireValidDID(const RegistryState &state, const std::string &did) {
        if (!state.isValidDID(did))
            return Check::err(validation_error(ERR_INVALID_DID, "DID is not registered or revoked: " + did));
        return pass();
    }

    Check requireResolvable(const RegistryState &state, const std::string &identifier, bool allow_units,
                            const std::string &field) {
        if (state.vehicles.exists(identifier) || state.vehicles.isBound(identifier))
            return pass();
        if (state.principals.findPrincipalByDID(identifier) != nullptr)
            return pass();
        if (allow_units) {
            auto unit = state.principals.findRoadsideUnitByDID(identifier);
            if (unit != nullptr && unit->active)
                return pass();
        }
        return Check::err(
            validation_error(ERR_UNRESOLVED_IDENTIFIER, field + " does not name a registered entity: " + identifier));
    }

    Check requireController(const RegistryState &state, const std::string &did, const Address &address) {
        auto document = state.documents.find(did);
        if (document != nullptr && !document->controller.isNull() && document->controller != address)
            return Check::err(authorization_error(ERR_NOT_CONTROLLER,
                                                  address.toString() + " is not the controller of " + did));
        return pass();
    }

} // namespace motorid::policy
