#pragma once

#include <datapod/datapod.hpp>
#include <initializer_list>
#include <motorid/identity/address.hpp>
#include <motorid/registry/types.hpp>
#include <string>
#include <vector>

namespace motorid {

    /// Mutating operation types
    enum class OperationType : dp::u8 {
        RegisterPrincipal = 0,
        RegisterRoadsideUnit = 1,
        SetRoadsideUnitActive = 2,
        RegisterVehicle = 3,
        TransferOwnership = 4,
        UpdateVehicleConfig = 5,
        AuthorizeMechanic = 6,
        AddMaintenanceRecord = 7,
        CreateInsurancePolicy = 8,
        StoreDIDDocument = 9,
        RevokeDIDDocument = 10,
        StoreCredential = 11,
        RecordInteraction = 12,
    };

    inline std::string operationTypeToString(OperationType type) {
        switch (type) {
        case OperationType::RegisterPrincipal:
            return "registerPrincipal";
        case OperationType::RegisterRoadsideUnit:
            return "registerRoadsideUnit";
        case OperationType::SetRoadsideUnitActive:
            return "setRoadsideUnitActive";
        case OperationType::RegisterVehicle:
            return "registerVehicle";
        case OperationType::TransferOwnership:
            return "transferOwnership";
        case OperationType::UpdateVehicleConfig:
            return "updateVehicleConfig";
        case OperationType::AuthorizeMechanic:
            return "authorizeMechanic";
        case OperationType::AddMaintenanceRecord:
            return "addMaintenanceRecord";
        case OperationType::CreateInsurancePolicy:
            return "createInsurancePolicy";
        case OperationType::StoreDIDDocument:
            return "storeDIDDocument";
        case OperationType::RevokeDIDDocument:
            return "revokeDIDDocument";
        case OperationType::StoreCredential:
            return "storeCredential";
        case OperationType::RecordInteraction:
            return "recordInteraction";
        default:
            return "unknown";
        }
    }

    /// A submitted mutating operation
    /// This is the unit that is validated, journaled and applied. Replaying the journal
    /// applies the same records in the same order and rebuilds the same state.
    ///
    /// Field usage per type (fields[] is positional):
    ///   RegisterPrincipal      fields = {name, entityDID, walletDID}, number_a = role
    ///   RegisterRoadsideUnit   fields = {name, location, entityDID, walletDID}
    ///   SetRoadsideUnitActive  flag = active
    ///   RegisterVehicle        key = vin, fields = {ownerDID, entityDID, make, model, walletDID,
    ///                          credentialDID}, number_a = year
    ///   TransferOwnership      key = vin, target = new owner
    ///   UpdateVehicleConfig    key = vehicle wallet DID, fields = {config}
    ///   AuthorizeMechanic      key = vin, target = mechanic
    ///   AddMaintenanceRecord   key = vin, fields = {description}, flag = critical
    ///   CreateInsurancePolicy  key = vin, number_a = start, number_b = end
    ///   StoreDIDDocument       key = did, payload = document
    ///   RevokeDIDDocument      key = did
    ///   StoreCredential        key = credential id, fields = {issuerDID, subjectDID}, payload = data
    ///   RecordInteraction      target = destination, fields = {sourceIdentifier,
    ///                          destinationIdentifier, type}, payload, source = caller
    struct Operation {
        dp::u8 type{0};       // OperationType
        Address caller;       // submitting address
        dp::i64 timestamp{0}; // assigned at submission
        dp::String key;
        dp::Vector<dp::String> fields;
        Address target;
        dp::i64 number_a{0};
        dp::i64 number_b{0};
        bool flag{false};
        dp::Vector<dp::u8> payload;

        inline OperationType getType() const { return static_cast<OperationType>(type); }

        inline std::string getKey() const { return std::string(key.c_str()); }

        /// Positional string argument, empty when absent
        inline std::string field(dp::usize index) const {
            if (index >= fields.size())
                return "";
            return std::string(fields[index].c_str());
        }

        inline std::vector<uint8_t> getPayload() const { return std::vector<uint8_t>(payload.begin(), payload.end()); }

        /// Payload bytes as a string, embedded NULs included
        inline std::string payloadText() const { return std::string(payload.begin(), payload.end()); }

        // === Builders ===

        inline static Operation registerPrincipal(const Address &caller, const std::string &name, Role role,
                                                  const std::string &entity_did, const std::string &wallet_did) {
            Operation op(OperationType::RegisterPrincipal, caller);
            op.addFields({name, entity_did, wallet_did});
            op.number_a = static_cast<dp::i64>(role);
            return op;
        }

        inline static Operation registerRoadsideUnit(const Address &caller, const std::string &name,
                                                     const std::string &location, const std::string &entity_did,
                                                     const std::string &wallet_did) {
            Operation op(OperationType::RegisterRoadsideUnit, caller);
            op.addFields({name, location, entity_did, wallet_did});
            return op;
        }

        inline static Operation setRoadsideUnitActive(const Address &caller, bool active) {
            Operation op(OperationType::SetRoadsideUnitActive, caller);
            op.flag = active;
            return op;
        }

        inline static Operation registerVehicle(const Address &caller, const std::string &vin,
                                                const std::string &owner_did, const std::string &entity_did,
                                                dp::i32 year, const std::string &make, const std::string &model,
                                                const std::string &wallet_did, const std::string &credential_did) {
            Operation op(OperationType::RegisterVehicle, caller);
            op.key = dp::String(vin.c_str());
            op.addFields({owner_did, entity_did, make, model, wallet_did, credential_did});
            op.number_a = year;
            return op;
        }

        inline static Operation transferOwnership(const Address &caller, const std::string &vin,
                                                  const Address &new_owner) {
            Operation op(OperationType::TransferOwnership, caller);
            op.key = dp::String(vin.c_str());
            op.target = new_owner;
            return op;
        }

        inline static Operation updateVehicleConfig(const Address &caller, const std::string &vehicle_wallet_did,
                                                    const std::string &config) {
            Operation op(OperationType::UpdateVehicleConfig, caller);
            op.key = dp::String(vehicle_wallet_did.c_str());
            op.addFields({config});
            return op;
        }

        inline static Operation authorizeMechanic(const Address &caller, const std::string &vin,
                                                  const Address &mechanic) {
            Operation op(OperationType::AuthorizeMechanic, caller);
            op.key = dp::String(vin.c_str());
            op.target = mechanic;
            return op;
        }

        inline static Operation addMaintenanceRecord(const Address &caller, const std::string &vin,
                                                     const std::string &description, bool critical) {
            Operation op(OperationType::AddMaintenanceRecord, caller);
            op.key = dp::String(vin.c_str());
            op.addFields({description});
            op.flag = critical;
            return op;
        }

        inline static Operation createInsurancePolicy(const Address &caller, const std::string &vin,
                                                      dp::i64 start_date, dp::i64 end_date) {
            Operation op(OperationType::CreateInsurancePolicy, caller);
            op.key = dp::String(vin.c_str());
            op.number_a = start_date;
            op.number_b = end_date;
            return op;
        }

        inline static Operation storeDIDDocument(const Address &caller, const std::string &did,
                                                 const std::string &document) {
            Operation op(OperationType::StoreDIDDocument, caller);
            op.key = dp::String(did.c_str());
            op.setPayload(document);
            return op;
        }

        inline static Operation revokeDIDDocument(const Address &caller, const std::string &did) {
            Operation op(OperationType::RevokeDIDDocument, caller);
            op.key = dp::String(did.c_str());
            return op;
        }

        inline static Operation storeCredential(const Address &caller, const std::string &credential_id,
                                                const std::string &issuer_did, const std::string &subject_did,
                                                const std::string &data) {
            Operation op(OperationType::StoreCredential, caller);
            op.key = dp::String(credential_id.c_str());
            op.addFields({issuer_did, subject_did});
            op.setPayload(data);
            return op;
        }

        inline static Operation recordInteraction(const Address &source, const Address &destination,
                                                  const std::string &source_identifier,
                                                  const std::string &destination_identifier,
                                                  const std::string &interaction_type,
                                                  const std::vector<uint8_t> &payload) {
            Operation op(OperationType::RecordInteraction, source);
            op.target = destination;
            op.addFields({source_identifier, destination_identifier, interaction_type});
            op.payload = dp::Vector<dp::u8>(payload.begin(), payload.end());
            return op;
        }

        // === Serialization ===

        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<Operation &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        inline static dp::Result<Operation, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, Operation>(buf);
                return dp::Result<Operation, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<Operation, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        auto members() {
            return std::tie(type, caller, timestamp, key, fields, target, number_a, number_b, flag, payload);
        }
        auto members() const {
            return std::tie(type, caller, timestamp, key, fields, target, number_a, number_b, flag, payload);
        }

        Operation() = default;

      private:
        inline Operation(OperationType op_type, const Address &op_caller)
            : type(static_cast<dp::u8>(op_type)), caller(op_caller) {}

        inline void addFields(std::initializer_list<std::string> values) {
            for (const auto &value : values) {
                fields.push_back(dp::String(value.c_str()));
            }
        }

        inline void setPayload(const std::string &bytes) {
            for (char c : bytes) {
                payload.push_back(static_cast<dp::u8>(c));
            }
        }
    };

} // namespace motorid
