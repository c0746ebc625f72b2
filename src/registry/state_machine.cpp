#include <motorid/registry/state_machine.hpp>

namespace motorid {

    namespace {

        using policy::Check;

        // === Validation per operation ===

        Check validateRegisterPrincipal(const RegistryState &state, const Operation &op) {
            auto caller_check = policy::requireNonNull(op.caller, "caller");
            if (caller_check.is_err())
                return caller_check;
            if (op.number_a < 0 || op.number_a >= ROLE_COUNT)
                return Check::err(validation_error(ERR_INVALID_ROLE, "Unknown role " + std::to_string(op.number_a)));
            auto name_check = policy::requireNonEmpty(op.field(0), "name");
            if (name_check.is_err())
                return name_check;
            auto entity_did_check = policy::requireNonEmpty(op.field(1), "entityDID");
            if (entity_did_check.is_err())
                return entity_did_check;
            auto wallet_did_check = policy::requireNonEmpty(op.field(2), "walletDID");
            if (wallet_did_check.is_err())
                return wallet_did_check;
            auto unregistered_check = policy::requireUnregistered(state, op.caller);
            if (unregistered_check.is_err())
                return unregistered_check;
            auto unbound_check = policy::requireUnbound(state, op.field(1));
            if (unbound_check.is_err())
                return unbound_check;
            return policy::requireUnbound(state, op.field(2));
        }

        Check validateRegisterRoadsideUnit(const RegistryState &state, const Operation &op) {
            auto caller_check = policy::requireNonNull(op.caller, "caller");
            if (caller_check.is_err())
                return caller_check;
            auto name_check = policy::requireNonEmpty(op.field(0), "name");
            if (name_check.is_err())
                return name_check;
            auto entity_did_check = policy::requireNonEmpty(op.field(2), "entityDID");
            if (entity_did_check.is_err())
                return entity_did_check;
            auto wallet_did_check = policy::requireNonEmpty(op.field(3), "walletDID");
            if (wallet_did_check.is_err())
                return wallet_did_check;
            if (state.principals.isRoadsideUnit(op.caller))
                return Check::err(conflict_error(ERR_ALREADY_REGISTERED,
                                                 "Roadside unit already registered: " + op.caller.toString()));
            auto unbound_check = policy::requireUnbound(state, op.field(2));
            if (unbound_check.is_err())
                return unbound_check;
            return policy::requireUnbound(state, op.field(3));
        }

        Check validateSetRoadsideUnitActive(const RegistryState &state, const Operation &op) {
            if (!state.principals.isRoadsideUnit(op.caller))
                return Check::err(
                    not_found_error(ERR_UNIT_NOT_FOUND, "No roadside unit at " + op.caller.toString()));
            return policy::pass();
        }

        Check validateRegisterVehicle(const RegistryState &state, const Operation &op) {
            auto vin = op.getKey();
            auto vin_check = policy::requireNonEmpty(vin, "vin");
            if (vin_check.is_err())
                return vin_check;
            auto owner_did_check = policy::requireNonEmpty(op.field(0), "ownerDID");
            if (owner_did_check.is_err())
                return owner_did_check;
            auto entity_did_check = policy::requireNonEmpty(op.field(1), "entityDID");
            if (entity_did_check.is_err())
                return entity_did_check;
            auto wallet_did_check = policy::requireNonEmpty(op.field(4), "walletDID");
            if (wallet_did_check.is_err())
                return wallet_did_check;

            if (state.principals.findPrincipalByDID(op.field(0)) == nullptr)
                return Check::err(
                    not_found_error(ERR_DID_NOT_FOUND, "Owner DID does not resolve to a principal: " + op.field(0)));
            if (state.vehicles.exists(vin))
                return Check::err(conflict_error(ERR_DUPLICATE_VIN, "Vehicle already registered: " + vin));

            auto unbound_check = policy::requireUnbound(state, op.field(1));
            if (unbound_check.is_err())
                return unbound_check;
            return policy::requireUnbound(state, op.field(4));
        }

        Check validateTransferOwnership(const RegistryState &state, const Operation &op) {
            auto vehicle_owner_check = policy::requireVehicleOwner(state, op.caller, op.getKey());
            if (vehicle_owner_check.is_err())
                return vehicle_owner_check;
            if (!state.principals.isPrincipal(op.target))
                return Check::err(validation_error(ERR_UNREGISTERED_OWNER,
                                                   "New owner is not registered: " + op.target.toString()));
            return policy::pass();
        }

        Check validateUpdateVehicleConfig(const RegistryState &state, const Operation &op) {
            auto wallet_did = op.getKey();
            auto vin = state.vehicles.vinForDID(wallet_did);
            if (vin == nullptr || state.vehicles.find(*vin)->getWalletDID() != wallet_did)
                return Check::err(
                    not_found_error(ERR_VEHICLE_NOT_FOUND, "No vehicle with wallet DID " + wallet_did));
            auto vehicle_owner_check = policy::requireVehicleOwner(state, op.caller, *vin);
            if (vehicle_owner_check.is_err())
                return vehicle_owner_check;
            return policy::requireNonEmpty(op.field(0), "config");
        }

        Check validateAuthorizeMechanic(const RegistryState &state, const Operation &op) {
            auto vehicle_owner_check = policy::requireVehicleOwner(state, op.caller, op.getKey());
            if (vehicle_owner_check.is_err())
                return vehicle_owner_check;
            return policy::requireRole(state, op.target, Role::Mechanic, ErrorKind::Validation);
        }

        Check validateAddMaintenanceRecord(const RegistryState &state, const Operation &op) {
            auto vin = op.getKey();
            if (!state.vehicles.exists(vin))
                return Check::err(not_found_error(ERR_VEHICLE_NOT_FOUND, "Vehicle not found: " + vin));
            auto description_check = policy::requireNonEmpty(op.field(0), "description");
            if (description_check.is_err())
                return description_check;
            auto role_check = policy::requireRole(state, op.caller, Role::Mechanic);
            if (role_check.is_err())
                return role_check;
            return policy::requireMechanicAuthorized(state, vin, op.caller);
        }

        Check validateCreateInsurancePolicy(const RegistryState &state, const Operation &op) {
            auto vin = op.getKey();
            auto role_check = policy::requireRole(state, op.caller, Role::InsuranceCompany, ErrorKind::Validation);
            if (role_check.is_err())
                return role_check;

            auto vehicle = state.vehicles.find(vin);
            if (vehicle == nullptr)
                return Check::err(validation_error(ERR_UNKNOWN_VEHICLE, "Vehicle not registered: " + vin));
            if (vehicle->current_owner.isNull())
                return Check::err(validation_error(ERR_NO_OWNER, "Vehicle has no owner: " + vin));
            if (op.number_b < op.number_a)
                return Check::err(validation_error(ERR_INVALID_PERIOD, "Policy ends before it starts"));
            return policy::pass();
        }

        Check validateStoreDIDDocument(const RegistryState &state, const Operation &op) {
            auto did = op.getKey();
            auto caller_check = policy::requireNonNull(op.caller, "caller");
            if (caller_check.is_err())
                return caller_check;
            auto did_check = policy::requireNonEmpty(did, "did");
            if (did_check.is_err())
                return did_check;
            auto document_check = policy::requireNonEmpty(op.payloadText(), "document");
            if (document_check.is_err())
                return document_check;
            auto controller_check = policy::requireController(state, did, op.caller);
            if (controller_check.is_err())
                return controller_check;

            auto existing = state.documents.find(did);
            if (existing != nullptr && !existing->active)
                return Check::err(validation_error(ERR_DOCUMENT_REVOKED, "DID document is revoked: " + did));
            return policy::pass();
        }

        Check validateRevokeDIDDocument(const RegistryState &state, const Operation &op) {
            auto did = op.getKey();
            auto existing = state.documents.find(did);
            if (existing == nullptr)
                return Check::err(not_found_error(ERR_DOCUMENT_NOT_FOUND, "No DID document for " + did));
            auto controller_check = policy::requireController(state, did, op.caller);
            if (controller_check.is_err())
                return controller_check;
            if (!existing->active)
                return Check::err(validation_error(ERR_DOCUMENT_REVOKED, "DID document already revoked: " + did));
            return policy::pass();
        }

        Check validateStoreCredential(const RegistryState &state, const Operation &op) {
            auto credential_id = op.getKey();
            auto credential_id_check = policy::requireNonEmpty(credential_id, "credentialId");
            if (credential_id_check.is_err())
                return credential_id_check;
            auto issuer_check = policy::requireValidDID(state, op.field(0));
            if (issuer_check.is_err())
                return issuer_check;
            auto subject_check = policy::requireValidDID(state, op.field(1));
            if (subject_check.is_err())
                return subject_check;
            auto data_check = policy::requireNonEmpty(op.payloadText(), "data");
            if (data_check.is_err())
                return data_check;
            if (state.credentials.contains(credential_id))
                return Check::err(
                    conflict_error(ERR_DUPLICATE_CREDENTIAL, "Credential already stored: " + credential_id));
            return policy::pass();
        }

        Check validateRecordInteraction(const RegistryState &state, const Operation &op) {
            auto source_identifier_check = policy::requireNonEmpty(op.field(0), "sourceIdentifier");
            if (source_identifier_check.is_err())
                return source_identifier_check;
            auto destination_identifier_check = policy::requireNonEmpty(op.field(1), "destinationIdentifier");
            if (destination_identifier_check.is_err())
                return destination_identifier_check;
            auto type_check = policy::requireNonEmpty(op.field(2), "type");
            if (type_check.is_err())
                return type_check;
            auto source_resolved_check = policy::requireResolvable(state, op.field(0), false, "sourceIdentifier");
            if (source_resolved_check.is_err())
                return source_resolved_check;
            return policy::requireResolvable(state, op.field(1), true, "destinationIdentifier");
        }

        // === Application helpers ===

        RegistryEvent makeEvent(EventType type, const Operation &op, dp::u64 sequence, const std::string &subject) {
            RegistryEvent event(type, op.caller, subject);
            event.sequence = sequence;
            event.timestamp = op.timestamp;
            return event;
        }

        void emitDIDRegistered(std::vector<RegistryEvent> &events, const Operation &op, dp::u64 sequence,
                               const std::string &did, const std::string &bound_to) {
            events.push_back(makeEvent(EventType::DIDRegistered, op, sequence, did).with("bound_to", bound_to));
        }

    } // namespace

    // ===========================================
    // validate
    // ===========================================

    policy::Check validate(const RegistryState &state, const Operation &op) {
        switch (op.getType()) {
        case OperationType::RegisterPrincipal:
            return validateRegisterPrincipal(state, op);
        case OperationType::RegisterRoadsideUnit:
            return validateRegisterRoadsideUnit(state, op);
        case OperationType::SetRoadsideUnitActive:
            return validateSetRoadsideUnitActive(state, op);
        case OperationType::RegisterVehicle:
            return validateRegisterVehicle(state, op);
        case OperationType::TransferOwnership:
            return validateTransferOwnership(state, op);
        case OperationType::UpdateVehicleConfig:
            return validateUpdateVehicleConfig(state, op);
        case OperationType::AuthorizeMechanic:
            return validateAuthorizeMechanic(state, op);
        case OperationType::AddMaintenanceRecord:
            return validateAddMaintenanceRecord(state, op);
        case OperationType::CreateInsurancePolicy:
            return validateCreateInsurancePolicy(state, op);
        case OperationType::StoreDIDDocument:
            return validateStoreDIDDocument(state, op);
        case OperationType::RevokeDIDDocument:
            return validateRevokeDIDDocument(state, op);
        case OperationType::StoreCredential:
            return validateStoreCredential(state, op);
        case OperationType::RecordInteraction:
            return validateRecordInteraction(state, op);
        default:
            return Check::err(
                validation_error(ERR_INVALID_OPERATION, "Unknown operation type " + std::to_string(op.type)));
        }
    }

    // ===========================================
    // apply
    // ===========================================

    std::vector<RegistryEvent> apply(RegistryState &state, const Operation &op, dp::u64 sequence) {
        std::vector<RegistryEvent> events;
        state.last_sequence = sequence;

        switch (op.getType()) {
        case OperationType::RegisterPrincipal: {
            Principal principal;
            principal.address = op.caller;
            principal.name = dp::String(op.field(0).c_str());
            principal.role = static_cast<dp::u8>(op.number_a);
            principal.entity_did = dp::String(op.field(1).c_str());
            principal.wallet_did = dp::String(op.field(2).c_str());
            principal.registered = true;
            principal.registered_at = op.timestamp;
            state.principals.addPrincipal(principal);

            events.push_back(makeEvent(EventType::PrincipalRegistered, op, sequence, op.caller.toString())
                                 .with("name", op.field(0))
                                 .with("role", roleToString(principal.getRole())));
            emitDIDRegistered(events, op, sequence, op.field(1), op.caller.toString());
            if (op.field(2) != op.field(1))
                emitDIDRegistered(events, op, sequence, op.field(2), op.caller.toString());
            break;
        }

        case OperationType::RegisterRoadsideUnit: {
            RoadsideUnit unit;
            unit.address = op.caller;
            unit.name = dp::String(op.field(0).c_str());
            unit.location = dp::String(op.field(1).c_str());
            unit.entity_did = dp::String(op.field(2).c_str());
            unit.wallet_did = dp::String(op.field(3).c_str());
            unit.active = true;
            unit.registered_at = op.timestamp;
            state.principals.addRoadsideUnit(unit);

            events.push_back(makeEvent(EventType::RoadsideUnitRegistered, op, sequence, op.caller.toString())
                                 .with("name", op.field(0))
                                 .with("location", op.field(1)));
            emitDIDRegistered(events, op, sequence, op.field(2), op.caller.toString());
            if (op.field(3) != op.field(2))
                emitDIDRegistered(events, op, sequence, op.field(3), op.caller.toString());
            break;
        }

        case OperationType::SetRoadsideUnitActive:
            state.principals.setRoadsideUnitActive(op.caller, op.flag);
            events.push_back(makeEvent(EventType::RoadsideUnitStatusChanged, op, sequence, op.caller.toString())
                                 .with("active", op.flag ? "true" : "false"));
            break;

        case OperationType::RegisterVehicle: {
            auto vin = op.getKey();
            auto owner = state.principals.findPrincipalByDID(op.field(0))->address;

            Vehicle vehicle;
            vehicle.vin = op.key;
            vehicle.make = dp::String(op.field(2).c_str());
            vehicle.model = dp::String(op.field(3).c_str());
            vehicle.year = static_cast<dp::i32>(op.number_a);
            vehicle.current_owner = owner;
            vehicle.entity_did = dp::String(op.field(1).c_str());
            vehicle.wallet_did = dp::String(op.field(4).c_str());
            vehicle.credential_did = dp::String(op.field(5).c_str());
            vehicle.registered = true;
            vehicle.registered_at = op.timestamp;
            state.vehicles.add(vehicle);

            events.push_back(makeEvent(EventType::VehicleRegistered, op, sequence, vin)
                                 .with("owner", owner.toString())
                                 .with("entity_did", op.field(1))
                                 .with("wallet_did", op.field(4)));
            for (const auto &did : {op.field(1), op.field(4)}) {
                if (state.principals.markRegistered(did))
                    emitDIDRegistered(events, op, sequence, did, vin);
            }
            break;
        }

        case OperationType::TransferOwnership: {
            auto vin = op.getKey();
            Address previous = state.vehicles.transfer(vin, op.target);
            bool deactivated = state.maintenance.deactivatePolicy(vin);

            events.push_back(makeEvent(EventType::OwnershipTransferred, op, sequence, vin)
                                 .with("previous_owner", previous.toString())
                                 .with("new_owner", op.target.toString())
                                 .with("policy_deactivated", deactivated ? "true" : "false"));
            break;
        }

        case OperationType::UpdateVehicleConfig: {
            auto vin = *state.vehicles.vinForDID(op.getKey());
            state.vehicles.setConfig(vin, op.field(0));
            events.push_back(makeEvent(EventType::VehicleConfigUpdated, op, sequence, vin)
                                 .with("wallet_did", op.getKey()));
            break;
        }

        case OperationType::AuthorizeMechanic: {
            auto vin = op.getKey();
            bool granted = state.maintenance.authorize(vin, op.target);
            events.push_back(makeEvent(EventType::MechanicAuthorized, op, sequence, vin)
                                 .with("mechanic", op.target.toString())
                                 .with("new_grant", granted ? "true" : "false"));
            break;
        }

        case OperationType::AddMaintenanceRecord: {
            auto vin = op.getKey();
            MaintenanceRecord record;
            record.mechanic = op.caller;
            record.description = dp::String(op.field(0).c_str());
            record.timestamp = op.timestamp;
            record.critical = op.flag;
            state.maintenance.append(vin, record);
            state.vehicles.addMaintenanceProvider(vin, op.caller);

            events.push_back(makeEvent(EventType::MaintenanceAdded, op, sequence, vin)
                                 .with("mechanic", op.caller.toString())
                                 .with("description", op.field(0))
                                 .with("critical", op.flag ? "true" : "false"));
            break;
        }

        case OperationType::CreateInsurancePolicy: {
            auto vin = op.getKey();
            InsurancePolicy insurance;
            insurance.vin = op.key;
            insurance.insurer = op.caller;
            insurance.vehicle_owner = state.vehicles.find(vin)->current_owner;
            insurance.start_date = op.number_a;
            insurance.end_date = op.number_b;
            insurance.active = true;
            state.maintenance.putPolicy(insurance);
            state.vehicles.setInsurer(vin, op.caller);

            events.push_back(makeEvent(EventType::PolicyCreated, op, sequence, vin)
                                 .with("insurer", op.caller.toString())
                                 .with("owner", insurance.vehicle_owner.toString())
                                 .with("start_date", std::to_string(op.number_a))
                                 .with("end_date", std::to_string(op.number_b)));
            break;
        }

        case OperationType::StoreDIDDocument: {
            auto did = op.getKey();
            bool created = state.documents.upsert(did, op.payload, op.timestamp, op.caller);
            if (state.principals.markRegistered(did))
                emitDIDRegistered(events, op, sequence, did, op.caller.toString());
            events.push_back(makeEvent(EventType::DIDDocumentUpdated, op, sequence, did)
                                 .with("controller", op.caller.toString())
                                 .with("created", created ? "true" : "false"));
            break;
        }

        case OperationType::RevokeDIDDocument:
            state.documents.revoke(op.getKey(), op.timestamp);
            events.push_back(makeEvent(EventType::DIDDocumentRevoked, op, sequence, op.getKey()));
            break;

        case OperationType::StoreCredential: {
            Credential credential;
            credential.credential_id = op.key;
            credential.issuer = op.caller;
            credential.subject_did = dp::String(op.field(1).c_str());
            credential.data = op.payload;
            credential.stored_at = op.timestamp;
            state.credentials.put(credential);

            events.push_back(makeEvent(EventType::CredentialStored, op, sequence, op.getKey())
                                 .with("issuer", op.caller.toString())
                                 .with("issuer_did", op.field(0))
                                 .with("subject_did", op.field(1)));
            break;
        }

        case OperationType::RecordInteraction: {
            Interaction interaction;
            interaction.source = op.caller;
            interaction.destination = op.target;
            interaction.source_identifier = dp::String(op.field(0).c_str());
            interaction.destination_identifier = dp::String(op.field(1).c_str());
            interaction.interaction_type = dp::String(op.field(2).c_str());
            interaction.payload = op.payload;
            interaction.timestamp = op.timestamp;
            auto position = state.interactions.append(interaction);

            events.push_back(makeEvent(EventType::InteractionRecorded, op, sequence, op.field(0))
                                 .with("destination", op.field(1))
                                 .with("type", op.field(2))
                                 .with("position", std::to_string(position)));
            break;
        }

        default:
            break;
        }

        return events;
    }

} // namespace motorid
