#pragma once

#include <condition_variable>
#include <datapod/datapod.hpp>
#include <functional>
#include <map>
#include <memory>
#include <motorid/registry/event.hpp>
#include <motorid/registry/operation.hpp>
#include <motorid/registry/options.hpp>
#include <motorid/registry/state.hpp>
#include <motorid/storage/journal_store.hpp>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace motorid {

    // ===========================================
    // Registry - the single owner of all registry state
    // ===========================================

    /// Sequentially consistent registry engine
    /// Every mutation is validated in full, journaled (when a journal is attached) and then
    /// applied under one writer lock, so an operation either commits completely with its
    /// notifications or fails with a typed error and changes nothing. Queries take a shared
    /// lock and return copies.
    class Registry {
      public:
        using Subscriber = std::function<void(const RegistryEvent &)>;
        using SubscriptionId = dp::u64;

        /// In-memory registry; `options.journal_path` is only honoured by open()
        explicit Registry(RegistryOptions options = RegistryOptions{});
        ~Registry() = default;

        Registry(const Registry &) = delete;
        Registry &operator=(const Registry &) = delete;

        /// Open a registry, replaying the journal at `options.journal_path` when set
        static dp::Result<std::unique_ptr<Registry>, dp::Error> open(const RegistryOptions &options);

        // ===========================================
        // Principal registry
        // ===========================================

        dp::Result<Receipt, dp::Error> registerPrincipal(const Address &caller, const std::string &name, Role role,
                                                         const std::string &entity_did,
                                                         const std::string &wallet_did);

        dp::Result<Receipt, dp::Error> registerRoadsideUnit(const Address &caller, const std::string &name,
                                                            const std::string &location,
                                                            const std::string &entity_did,
                                                            const std::string &wallet_did);

        /// Only the unit itself can toggle its status
        dp::Result<Receipt, dp::Error> setRoadsideUnitActive(const Address &caller, bool active);

        bool isRegistered(const std::string &did) const;
        dp::Result<Address, dp::Error> resolveAddress(const std::string &did) const;
        dp::Result<Principal, dp::Error> getPrincipal(const Address &address) const;
        std::vector<Address> getRegisteredAddresses() const;
        dp::Result<RoadsideUnit, dp::Error> getRoadsideUnit(const Address &address) const;

        /// Registered and its DID document, if any, not revoked
        bool isValidDID(const std::string &did) const;

        // ===========================================
        // Vehicle registry
        // ===========================================

        /// `caller` is recorded for provenance only; ownership follows `owner_did`
        dp::Result<Receipt, dp::Error> registerVehicle(const Address &caller, const std::string &vin,
                                                       const std::string &owner_did, const std::string &entity_did,
                                                       dp::i32 year, const std::string &make,
                                                       const std::string &model, const std::string &wallet_did,
                                                       const std::string &credential_did = "");

        dp::Result<Receipt, dp::Error> transferOwnership(const Address &caller, const std::string &vin,
                                                         const Address &new_owner);

        dp::Result<Receipt, dp::Error> updateVehicleConfig(const Address &caller, const std::string &vehicle_wallet_did,
                                                           const std::string &config);

        dp::Result<Vehicle, dp::Error> getVehicle(const std::string &vin) const;

        /// Lookup by entity or wallet DID
        dp::Result<Vehicle, dp::Error> getVehicleByDID(const std::string &did) const;

        /// Vehicles currently owned by the principal behind `owner_did`, in registration order
        std::vector<Vehicle> getVehiclesByOwnerDID(const std::string &owner_did) const;

        // ===========================================
        // Maintenance & insurance
        // ===========================================

        dp::Result<Receipt, dp::Error> authorizeMechanic(const Address &caller, const std::string &vin,
                                                         const Address &mechanic);

        dp::Result<Receipt, dp::Error> addMaintenanceRecord(const Address &caller, const std::string &vin,
                                                            const std::string &description, bool critical);

        dp::Result<Receipt, dp::Error> createInsurancePolicy(const Address &caller, const std::string &vin,
                                                             dp::i64 start_date, dp::i64 end_date);

        std::vector<MaintenanceRecord> getMaintenanceHistory(const std::string &vin, const Address &mechanic) const;
        bool isMechanicAuthorized(const std::string &vin, const Address &mechanic) const;
        dp::Result<InsurancePolicy, dp::Error> getInsurancePolicy(const std::string &vin) const;

        // ===========================================
        // DID documents & credentials
        // ===========================================

        dp::Result<Receipt, dp::Error> storeDIDDocument(const Address &caller, const std::string &did,
                                                        const std::string &document);

        dp::Result<Receipt, dp::Error> revokeDIDDocument(const Address &caller, const std::string &did);

        /// NotFound when the DID was never registered; an empty inactive record when it was
        /// registered without a document
        dp::Result<DIDDocumentRecord, dp::Error> getDIDDocument(const std::string &did) const;

        /// The stored issuer is `caller`, not `issuer_did`
        dp::Result<Receipt, dp::Error> storeCredential(const Address &caller, const std::string &credential_id,
                                                       const std::string &issuer_did,
                                                       const std::string &subject_did, const std::string &data);

        dp::Result<Credential, dp::Error> getCredential(const std::string &credential_id) const;

        // ===========================================
        // Interaction log
        // ===========================================

        dp::Result<Receipt, dp::Error> recordInteraction(const Address &source, const Address &destination,
                                                         const std::string &source_identifier,
                                                         const std::string &destination_identifier,
                                                         const std::string &interaction_type,
                                                         const std::vector<uint8_t> &payload);

        std::vector<Interaction> queryByIdentifier(const std::string &identifier) const;
        std::vector<Interaction> queryBetween(const std::string &first, const std::string &second) const;
        size_t interactionCount() const;

        // ===========================================
        // Engine
        // ===========================================

        /// Validate, journal and apply one operation; the timestamp is assigned here
        dp::Result<Receipt, dp::Error> submit(Operation op);

        /// Consistent copy of the whole state
        RegistryState snapshot() const;

        dp::u64 lastSequence() const;

        bool isPersistent() const;

        /// Recheck the journal hash chain; true for an in-memory registry
        dp::Result<bool, dp::Error> verifyJournal() const;

        /// Callbacks run after commit, in commit order, with no registry lock held.
        /// A callback may query the registry; an operation submitted from a callback is
        /// rejected with ERR_REENTRANT_SUBMIT.
        /// An exception thrown by a callback propagates out of the submitting call after commit.
        SubscriptionId subscribe(Subscriber callback);
        bool unsubscribe(SubscriptionId id);

        void printSummary() const;

      private:
        dp::Result<void, dp::Error> attachJournal();
        dp::i64 now() const;
        void dispatch(dp::u64 sequence, const std::vector<RegistryEvent> &events);

        RegistryOptions options_;
        RegistryState state_;
        std::unique_ptr<storage::JournalStore> journal_;
        mutable std::shared_mutex mutex_;

        std::mutex dispatch_mutex_;
        std::condition_variable dispatch_cv_;
        dp::u64 next_dispatch_ = 1;
        mutable std::mutex subscribers_mutex_;
        std::map<SubscriptionId, Subscriber> subscribers_;
        SubscriptionId next_subscription_ = 1;
    };

} // namespace motorid
