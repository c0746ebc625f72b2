#pragma once

#include <datapod/datapod.hpp>
#include <motorid/identity/address.hpp>
#include <string>
#include <utility>
#include <vector>

namespace motorid {

    /// Notification types emitted on commit
    enum class EventType : dp::u8 {
        PrincipalRegistered = 0,
        RoadsideUnitRegistered = 1,
        RoadsideUnitStatusChanged = 2,
        DIDRegistered = 3,
        VehicleRegistered = 4,
        OwnershipTransferred = 5,
        VehicleConfigUpdated = 6,
        MechanicAuthorized = 7,
        MaintenanceAdded = 8,
        PolicyCreated = 9,
        DIDDocumentUpdated = 10,
        DIDDocumentRevoked = 11,
        CredentialStored = 12,
        InteractionRecorded = 13,
    };

    inline std::string eventTypeToString(EventType type) {
        switch (type) {
        case EventType::PrincipalRegistered:
            return "principal-registered";
        case EventType::RoadsideUnitRegistered:
            return "unit-registered";
        case EventType::RoadsideUnitStatusChanged:
            return "unit-status-changed";
        case EventType::DIDRegistered:
            return "did-registered";
        case EventType::VehicleRegistered:
            return "vehicle-registered";
        case EventType::OwnershipTransferred:
            return "ownership-transferred";
        case EventType::VehicleConfigUpdated:
            return "vehicle-config-updated";
        case EventType::MechanicAuthorized:
            return "mechanic-authorized";
        case EventType::MaintenanceAdded:
            return "maintenance-added";
        case EventType::PolicyCreated:
            return "policy-created";
        case EventType::DIDDocumentUpdated:
            return "did-document-updated";
        case EventType::DIDDocumentRevoked:
            return "did-document-revoked";
        case EventType::CredentialStored:
            return "credential-stored";
        case EventType::InteractionRecorded:
            return "interaction-recorded";
        default:
            return "unknown";
        }
    }

    /// Committed-change notification
    /// `subject` is the primary key of what changed (address, VIN, DID, credential id or
    /// source identifier); the remaining identifying fields are carried as attributes.
    struct RegistryEvent {
        dp::u64 sequence{0}; // operation sequence that produced the event
        EventType type{EventType::PrincipalRegistered};
        dp::i64 timestamp{0};
        Address caller;
        std::string subject;
        std::vector<std::pair<std::string, std::string>> attributes;

        RegistryEvent() = default;

        RegistryEvent(EventType event_type, const Address &event_caller, std::string event_subject)
            : type(event_type), caller(event_caller), subject(std::move(event_subject)) {}

        inline RegistryEvent &with(const std::string &key, const std::string &value) {
            attributes.emplace_back(key, value);
            return *this;
        }

        /// Attribute value, empty when absent
        inline std::string attribute(const std::string &key) const {
            for (const auto &[k, v] : attributes) {
                if (k == key)
                    return v;
            }
            return "";
        }

        inline bool hasAttribute(const std::string &key) const {
            for (const auto &attr : attributes) {
                if (attr.first == key)
                    return true;
            }
            return false;
        }

        inline std::string toString() const {
            std::string out = "#" + std::to_string(sequence) + " " + eventTypeToString(type) + " " + subject;
            for (const auto &[k, v] : attributes) {
                out += " " + k + "=" + v;
            }
            return out;
        }
    };

    /// Result of a committed operation
    struct Receipt {
        dp::u64 sequence{0};
        dp::i64 timestamp{0};
        std::vector<RegistryEvent> events;

        /// First event of the given type, nullptr when none
        inline const RegistryEvent *find(EventType type) const {
            for (const auto &event : events) {
                if (event.type == type)
                    return &event;
            }
            return nullptr;
        }

        inline size_t count(EventType type) const {
            size_t n = 0;
            for (const auto &event : events) {
                if (event.type == type)
                    ++n;
            }
            return n;
        }
    };

} // namespace motorid
