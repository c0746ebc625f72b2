#pragma once

#include <datapod/datapod.hpp>
#include <motorid/registry/credential_store.hpp>
#include <motorid/registry/did_document_store.hpp>
#include <motorid/registry/interaction_log.hpp>
#include <motorid/registry/maintenance.hpp>
#include <motorid/registry/principal_registry.hpp>
#include <motorid/registry/vehicle_registry.hpp>
#include <string>

namespace motorid {

    /// The whole registry state
    /// Owned by exactly one Registry; copied out for snapshots.
    struct RegistryState {
        PrincipalRegistry principals;
        VehicleRegistry vehicles;
        MaintenanceLedger maintenance;
        DIDDocumentStore documents;
        CredentialStore credentials;
        InteractionLog interactions;
        dp::u64 last_sequence = 0; // sequence of the last committed operation, 0 when none

        /// DID bound to a principal, roadside unit or vehicle
        inline bool isBound(const std::string &did) const {
            return principals.isBound(did) || vehicles.isBound(did);
        }

        inline bool isRegisteredDID(const std::string &did) const { return principals.isRegistered(did); }

        /// Registered and not revoked
        inline bool isValidDID(const std::string &did) const {
            if (!principals.isRegistered(did))
                return false;
            auto document = documents.find(did);
            return document == nullptr || document->active;
        }
    };

} // namespace motorid
