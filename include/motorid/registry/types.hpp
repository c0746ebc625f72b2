#pragma once

#include <algorithm>
#include <cctype>
#include <datapod/datapod.hpp>
#include <motorid/identity/address.hpp>
#include <string>
#include <vector>

namespace motorid {

    /// Principal roles
    enum class Role : dp::u8 {
        Individual = 0,
        Mechanic = 1,
        InsuranceCompany = 2,
        RoadsideUnit = 3,
        VehicleManufacturer = 4,
        Car = 5,
    };

    constexpr dp::u8 ROLE_COUNT = 6;

    /// Get string name for role
    inline std::string roleToString(Role role) {
        switch (role) {
        case Role::Individual:
            return "Individual";
        case Role::Mechanic:
            return "Mechanic";
        case Role::InsuranceCompany:
            return "InsuranceCompany";
        case Role::RoadsideUnit:
            return "RoadsideUnit";
        case Role::VehicleManufacturer:
            return "VehicleManufacturer";
        case Role::Car:
            return "Car";
        default:
            return "Unknown";
        }
    }

    /// Parse a role name, case-insensitive, ignoring spaces and underscores
    /// ("insurance provider" and "INSURANCE_COMPANY" both map to InsuranceCompany)
    inline dp::Result<Role, dp::Error> roleFromString(const std::string &name) {
        std::string key;
        for (char c : name) {
            if (c == ' ' || c == '_' || c == '-')
                continue;
            key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }

        if (key == "individual")
            return dp::Result<Role, dp::Error>::ok(Role::Individual);
        if (key == "mechanic")
            return dp::Result<Role, dp::Error>::ok(Role::Mechanic);
        if (key == "insurancecompany" || key == "insuranceprovider" || key == "insurer")
            return dp::Result<Role, dp::Error>::ok(Role::InsuranceCompany);
        if (key == "roadsideunit")
            return dp::Result<Role, dp::Error>::ok(Role::RoadsideUnit);
        if (key == "vehiclemanufacturer" || key == "manufacturer")
            return dp::Result<Role, dp::Error>::ok(Role::VehicleManufacturer);
        if (key == "car" || key == "vehicle")
            return dp::Result<Role, dp::Error>::ok(Role::Car);

        return dp::Result<Role, dp::Error>::err(
            dp::Error::invalid_argument(dp::String(("Unknown role: " + name).c_str())));
    }

    // ===========================================
    // Records - POD structs with members()
    // ===========================================

    struct Principal {
        Address address;
        dp::String name;
        dp::u8 role{0}; // Role
        dp::String entity_did;
        dp::String wallet_did;
        bool registered{false};
        dp::i64 registered_at{0};

        inline Role getRole() const { return static_cast<Role>(role); }
        inline std::string getName() const { return std::string(name.c_str()); }
        inline std::string getEntityDID() const { return std::string(entity_did.c_str()); }
        inline std::string getWalletDID() const { return std::string(wallet_did.c_str()); }

        auto members() { return std::tie(address, name, role, entity_did, wallet_did, registered, registered_at); }
        auto members() const {
            return std::tie(address, name, role, entity_did, wallet_did, registered, registered_at);
        }
    };

    struct RoadsideUnit {
        Address address;
        dp::String name;
        dp::String location;
        dp::String entity_did;
        dp::String wallet_did;
        bool active{false};
        dp::i64 registered_at{0};

        inline std::string getName() const { return std::string(name.c_str()); }
        inline std::string getLocation() const { return std::string(location.c_str()); }
        inline std::string getEntityDID() const { return std::string(entity_did.c_str()); }
        inline std::string getWalletDID() const { return std::string(wallet_did.c_str()); }

        auto members() { return std::tie(address, name, location, entity_did, wallet_did, active, registered_at); }
        auto members() const {
            return std::tie(address, name, location, entity_did, wallet_did, active, registered_at);
        }
    };

    struct Vehicle {
        dp::String vin;
        dp::String make;
        dp::String model;
        dp::i32 year{0};
        Address current_owner;
        dp::Vector<Address> previous_owners; // append-only
        dp::String entity_did;
        dp::String wallet_did;
        dp::String credential_did;
        bool registered{false};
        Address current_insurer;                   // null when never insured
        dp::Vector<Address> maintenance_providers; // set semantics, first-seen order
        dp::String config;
        dp::i64 registered_at{0};

        inline std::string getVIN() const { return std::string(vin.c_str()); }
        inline std::string getMake() const { return std::string(make.c_str()); }
        inline std::string getModel() const { return std::string(model.c_str()); }
        inline std::string getEntityDID() const { return std::string(entity_did.c_str()); }
        inline std::string getWalletDID() const { return std::string(wallet_did.c_str()); }
        inline std::string getCredentialDID() const { return std::string(credential_did.c_str()); }
        inline std::string getConfig() const { return std::string(config.c_str()); }

        inline std::vector<Address> getPreviousOwners() const {
            return std::vector<Address>(previous_owners.begin(), previous_owners.end());
        }

        inline std::vector<Address> getMaintenanceProviders() const {
            return std::vector<Address>(maintenance_providers.begin(), maintenance_providers.end());
        }

        inline bool hasMaintenanceProvider(const Address &mechanic) const {
            return std::find(maintenance_providers.begin(), maintenance_providers.end(), mechanic) !=
                   maintenance_providers.end();
        }

        auto members() {
            return std::tie(vin, make, model, year, current_owner, previous_owners, entity_did, wallet_did,
                            credential_did, registered, current_insurer, maintenance_providers, config,
                            registered_at);
        }
        auto members() const {
            return std::tie(vin, make, model, year, current_owner, previous_owners, entity_did, wallet_did,
                            credential_did, registered, current_insurer, maintenance_providers, config,
                            registered_at);
        }
    };

    struct InsurancePolicy {
        dp::String vin;
        Address insurer;
        Address vehicle_owner; // owner at creation time
        dp::i64 start_date{0};
        dp::i64 end_date{0};
        bool active{false};

        inline std::string getVIN() const { return std::string(vin.c_str()); }

        auto members() { return std::tie(vin, insurer, vehicle_owner, start_date, end_date, active); }
        auto members() const { return std::tie(vin, insurer, vehicle_owner, start_date, end_date, active); }
    };

    struct MaintenanceRecord {
        Address mechanic;
        dp::String description;
        dp::i64 timestamp{0};
        bool critical{false};

        inline std::string getDescription() const { return std::string(description.c_str()); }

        auto members() { return std::tie(mechanic, description, timestamp, critical); }
        auto members() const { return std::tie(mechanic, description, timestamp, critical); }
    };

    /// Stored DID document (the document itself is an opaque payload)
    struct DIDDocumentRecord {
        dp::String did;
        dp::Vector<dp::u8> document;
        dp::i64 timestamp{0};
        bool active{false};
        Address controller; // null until the first store

        inline std::string getDID() const { return std::string(did.c_str()); }
        inline std::string getDocument() const { return std::string(document.begin(), document.end()); }

        auto members() { return std::tie(did, document, timestamp, active, controller); }
        auto members() const { return std::tie(did, document, timestamp, active, controller); }
    };

    /// Write-once verifiable credential
    struct Credential {
        dp::String credential_id;
        Address issuer; // submitting caller, not the claimed issuer DID
        dp::String subject_did;
        dp::Vector<dp::u8> data;
        dp::i64 stored_at{0};

        inline std::string getId() const { return std::string(credential_id.c_str()); }
        inline std::string getSubjectDID() const { return std::string(subject_did.c_str()); }
        inline std::string getData() const { return std::string(data.begin(), data.end()); }

        auto members() { return std::tie(credential_id, issuer, subject_did, data, stored_at); }
        auto members() const { return std::tie(credential_id, issuer, subject_did, data, stored_at); }
    };

    struct Interaction {
        dp::u64 sequence{0};
        Address source;
        Address destination;
        dp::String source_identifier;
        dp::String destination_identifier;
        dp::String interaction_type;
        dp::Vector<dp::u8> payload;
        dp::i64 timestamp{0};

        inline std::string getSourceIdentifier() const { return std::string(source_identifier.c_str()); }
        inline std::string getDestinationIdentifier() const { return std::string(destination_identifier.c_str()); }
        inline std::string getType() const { return std::string(interaction_type.c_str()); }

        inline std::vector<uint8_t> getPayload() const { return std::vector<uint8_t>(payload.begin(), payload.end()); }

        auto members() {
            return std::tie(sequence, source, destination, source_identifier, destination_identifier,
                            interaction_type, payload, timestamp);
        }
        auto members() const {
            return std::tie(sequence, source, destination, source_identifier, destination_identifier,
                            interaction_type, payload, timestamp);
        }
    };

} // namespace motorid
