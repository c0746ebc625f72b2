#include <algorithm>
#include <iostream>
#include <motorid/registry/registry.hpp>
#include <motorid/registry/state_machine.hpp>

namespace motorid {

    namespace {
        // Registries whose subscribers are running on this thread
        thread_local std::vector<const Registry *> dispatching;

        bool isDispatching(const Registry *registry) {
            return std::find(dispatching.begin(), dispatching.end(), registry) != dispatching.end();
        }

        struct DispatchScope {
            explicit DispatchScope(const Registry *registry) { dispatching.push_back(registry); }
            ~DispatchScope() { dispatching.pop_back(); }
        };
    } // namespace

    Registry::Registry(RegistryOptions options) : options_(std::move(options)) {}

    dp::Result<std::unique_ptr<Registry>, dp::Error> Registry::open(const RegistryOptions &options) {
        auto registry = std::make_unique<Registry>(options);
        if (!options.journal_path.empty()) {
            auto attached = registry->attachJournal();
            if (attached.is_err())
                return dp::Result<std::unique_ptr<Registry>, dp::Error>::err(attached.error());
        }
        return dp::Result<std::unique_ptr<Registry>, dp::Error>::ok(std::move(registry));
    }

    dp::Result<void, dp::Error> Registry::attachJournal() {
        std::unique_lock lock(mutex_);

        auto journal = std::make_unique<storage::JournalStore>();
        storage::OpenOptions opts;
        opts.sync_mode = options_.sync_mode;
        auto opened = journal->open(options_.journal_path, opts);
        if (opened.is_err())
            return opened;

        if (options_.verify_on_open) {
            auto verified = journal->verifyChain();
            if (verified.is_err())
                return dp::Result<void, dp::Error>::err(verified.error());
            if (!verified.value())
                return dp::Result<void, dp::Error>::err(journal_corrupt("Journal hash chain does not verify"));
        }

        auto records = journal->readAll();
        if (records.is_err())
            return dp::Result<void, dp::Error>::err(records.error());

        for (const auto &record : records.value()) {
            auto op = Operation::fromBytes(std::vector<uint8_t>(record.payload.begin(), record.payload.end()));
            if (op.is_err())
                return dp::Result<void, dp::Error>::err(
                    journal_corrupt("Undecodable operation #" + std::to_string(record.sequence)));

            auto check = validate(state_, op.value());
            if (check.is_err())
                return dp::Result<void, dp::Error>::err(
                    journal_corrupt("Replay rejected operation #" + std::to_string(record.sequence) + ": " +
                                    describeError(check.error())));

            apply(state_, op.value(), record.sequence);
        }

        if (options_.verbose) {
            std::cout << "Replayed " << records.value().size() << " operations from "
                      << options_.journal_path.c_str() << std::endl;
        }

        journal_ = std::move(journal);
        {
            std::lock_guard<std::mutex> turn(dispatch_mutex_);
            next_dispatch_ = state_.last_sequence + 1;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::i64 Registry::now() const {
        if (options_.clock)
            return options_.clock();
        return storage::currentTimestamp();
    }

    // ===========================================
    // Engine
    // ===========================================

    dp::Result<Receipt, dp::Error> Registry::submit(Operation op) {
        // A running callback owns this registry's dispatch turn
        if (isDispatching(this))
            return dp::Result<Receipt, dp::Error>::err(
                validation_error(ERR_REENTRANT_SUBMIT, "Operations cannot be submitted from a subscriber callback"));

        Receipt receipt;
        {
            std::unique_lock lock(mutex_);
            op.timestamp = now();

            auto check = validate(state_, op);
            if (check.is_err()) {
                if (options_.verbose) {
                    std::cout << "Rejected " << operationTypeToString(op.getType()) << " from "
                              << op.caller.toString() << ": " << describeError(check.error()) << std::endl;
                }
                return dp::Result<Receipt, dp::Error>::err(check.error());
            }

            dp::u64 sequence = state_.last_sequence + 1;
            if (journal_) {
                auto tx = journal_->beginTransaction();
                auto bytes = op.toBytes();
                auto staged = journal_->append(dp::Vector<dp::u8>(bytes.begin(), bytes.end()), op.timestamp);
                if (staged.is_err())
                    return dp::Result<Receipt, dp::Error>::err(staged.error());
                auto committed = tx->commit();
                if (committed.is_err())
                    return dp::Result<Receipt, dp::Error>::err(committed.error());
            }

            receipt.sequence = sequence;
            receipt.timestamp = op.timestamp;
            receipt.events = apply(state_, op, sequence);

            if (options_.verbose) {
                for (const auto &event : receipt.events) {
                    std::cout << "Committed " << event.toString() << std::endl;
                }
            }
        }

        dispatch(receipt.sequence, receipt.events);
        return dp::Result<Receipt, dp::Error>::ok(std::move(receipt));
    }

    void Registry::dispatch(dp::u64 sequence, const std::vector<RegistryEvent> &events) {
        // Operations commit in sequence order; their notifications go out in the same order.
        // The turn stays with this thread until next_dispatch_ advances.
        {
            std::unique_lock<std::mutex> turn(dispatch_mutex_);
            dispatch_cv_.wait(turn, [&] { return next_dispatch_ == sequence; });
        }

        auto pass_turn = [this]() {
            {
                std::lock_guard<std::mutex> turn(dispatch_mutex_);
                ++next_dispatch_;
            }
            dispatch_cv_.notify_all();
        };

        std::vector<Subscriber> callbacks;
        {
            std::lock_guard<std::mutex> lock(subscribers_mutex_);
            for (const auto &[id, callback] : subscribers_) {
                callbacks.push_back(callback);
            }
        }

        try {
            DispatchScope scope(this);
            for (const auto &event : events) {
                for (const auto &callback : callbacks) {
                    callback(event);
                }
            }
        } catch (...) {
            pass_turn();
            throw;
        }

        pass_turn();
    }

    Registry::SubscriptionId Registry::subscribe(Subscriber callback) {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        SubscriptionId id = next_subscription_++;
        subscribers_.emplace(id, std::move(callback));
        return id;
    }

    bool Registry::unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        return subscribers_.erase(id) > 0;
    }

    RegistryState Registry::snapshot() const {
        std::shared_lock lock(mutex_);
        return state_;
    }

    dp::u64 Registry::lastSequence() const {
        std::shared_lock lock(mutex_);
        return state_.last_sequence;
    }

    bool Registry::isPersistent() const {
        std::shared_lock lock(mutex_);
        return journal_ != nullptr;
    }

    dp::Result<bool, dp::Error> Registry::verifyJournal() const {
        std::shared_lock lock(mutex_);
        if (!journal_)
            return dp::Result<bool, dp::Error>::ok(true);
        return journal_->verifyChain();
    }

    // ===========================================
    // Principal registry
    // ===========================================

    dp::Result<Receipt, dp::Error> Registry::registerPrincipal(const Address &caller, const std::string &name,
                                                               Role role, const std::string &entity_did,
                                                               const std::string &wallet_did) {
        return submit(Operation::registerPrincipal(caller, name, role, entity_did, wallet_did));
    }

    dp::Result<Receipt, dp::Error> Registry::registerRoadsideUnit(const Address &caller, const std::string &name,
                                                                  const std::string &location,
                                                                  const std::string &entity_did,
                                                                  const std::string &wallet_did) {
        return submit(Operation::registerRoadsideUnit(caller, name, location, entity_did, wallet_did));
    }

    dp::Result<Receipt, dp::Error> Registry::setRoadsideUnitActive(const Address &caller, bool active) {
        return submit(Operation::setRoadsideUnitActive(caller, active));
    }

    bool Registry::isRegistered(const std::string &did) const {
        std::shared_lock lock(mutex_);
        return state_.isRegisteredDID(did);
    }

    dp::Result<Address, dp::Error> Registry::resolveAddress(const std::string &did) const {
        std::shared_lock lock(mutex_);
        return state_.principals.resolveAddress(did);
    }

    dp::Result<Principal, dp::Error> Registry::getPrincipal(const Address &address) const {
        std::shared_lock lock(mutex_);
        return state_.principals.getPrincipal(address);
    }

    std::vector<Address> Registry::getRegisteredAddresses() const {
        std::shared_lock lock(mutex_);
        return state_.principals.registeredAddresses();
    }

    dp::Result<RoadsideUnit, dp::Error> Registry::getRoadsideUnit(const Address &address) const {
        std::shared_lock lock(mutex_);
        return state_.principals.getRoadsideUnit(address);
    }

    bool Registry::isValidDID(const std::string &did) const {
        std::shared_lock lock(mutex_);
        return state_.isValidDID(did);
    }

    // ===========================================
    // Vehicle registry
    // ===========================================

    dp::Result<Receipt, dp::Error> Registry::registerVehicle(const Address &caller, const std::string &vin,
                                                             const std::string &owner_did,
                                                             const std::string &entity_did, dp::i32 year,
                                                             const std::string &make, const std::string &model,
                                                             const std::string &wallet_did,
                                                             const std::string &credential_did) {
        return submit(Operation::registerVehicle(caller, vin, owner_did, entity_did, year, make, model, wallet_did,
                                                 credential_did));
    }

    dp::Result<Receipt, dp::Error> Registry::transferOwnership(const Address &caller, const std::string &vin,
                                                               const Address &new_owner) {
        return submit(Operation::transferOwnership(caller, vin, new_owner));
    }

    dp::Result<Receipt, dp::Error> Registry::updateVehicleConfig(const Address &caller,
                                                                 const std::string &vehicle_wallet_did,
                                                                 const std::string &config) {
        return submit(Operation::updateVehicleConfig(caller, vehicle_wallet_did, config));
    }

    dp::Result<Vehicle, dp::Error> Registry::getVehicle(const std::string &vin) const {
        std::shared_lock lock(mutex_);
        return state_.vehicles.get(vin);
    }

    dp::Result<Vehicle, dp::Error> Registry::getVehicleByDID(const std::string &did) const {
        std::shared_lock lock(mutex_);
        auto vin = state_.vehicles.vinForDID(did);
        if (vin == nullptr)
            return dp::Result<Vehicle, dp::Error>::err(
                not_found_error(ERR_VEHICLE_NOT_FOUND, "No vehicle bound to DID " + did));
        return state_.vehicles.get(*vin);
    }

    std::vector<Vehicle> Registry::getVehiclesByOwnerDID(const std::string &owner_did) const {
        std::shared_lock lock(mutex_);
        auto owner = state_.principals.findPrincipalByDID(owner_did);
        if (owner == nullptr)
            return {};
        return state_.vehicles.ownedBy(owner->address);
    }

    // ===========================================
    // Maintenance & insurance
    // ===========================================

    dp::Result<Receipt, dp::Error> Registry::authorizeMechanic(const Address &caller, const std::string &vin,
                                                               const Address &mechanic) {
        return submit(Operation::authorizeMechanic(caller, vin, mechanic));
    }

    dp::Result<Receipt, dp::Error> Registry::addMaintenanceRecord(const Address &caller, const std::string &vin,
                                                                  const std::string &description, bool critical) {
        return submit(Operation::addMaintenanceRecord(caller, vin, description, critical));
    }

    dp::Result<Receipt, dp::Error> Registry::createInsurancePolicy(const Address &caller, const std::string &vin,
                                                                   dp::i64 start_date, dp::i64 end_date) {
        return submit(Operation::createInsurancePolicy(caller, vin, start_date, end_date));
    }

    std::vector<MaintenanceRecord> Registry::getMaintenanceHistory(const std::string &vin,
                                                                   const Address &mechanic) const {
        std::shared_lock lock(mutex_);
        return state_.maintenance.history(vin, mechanic);
    }

    bool Registry::isMechanicAuthorized(const std::string &vin, const Address &mechanic) const {
        std::shared_lock lock(mutex_);
        return state_.maintenance.isAuthorized(vin, mechanic);
    }

    dp::Result<InsurancePolicy, dp::Error> Registry::getInsurancePolicy(const std::string &vin) const {
        std::shared_lock lock(mutex_);
        return state_.maintenance.getPolicy(vin);
    }

    // ===========================================
    // DID documents & credentials
    // ===========================================

    dp::Result<Receipt, dp::Error> Registry::storeDIDDocument(const Address &caller, const std::string &did,
                                                              const std::string &document) {
        return submit(Operation::storeDIDDocument(caller, did, document));
    }

    dp::Result<Receipt, dp::Error> Registry::revokeDIDDocument(const Address &caller, const std::string &did) {
        return submit(Operation::revokeDIDDocument(caller, did));
    }

    dp::Result<DIDDocumentRecord, dp::Error> Registry::getDIDDocument(const std::string &did) const {
        std::shared_lock lock(mutex_);
        auto document = state_.documents.find(did);
        if (document != nullptr)
            return dp::Result<DIDDocumentRecord, dp::Error>::ok(*document);

        if (!state_.isRegisteredDID(did))
            return dp::Result<DIDDocumentRecord, dp::Error>::err(
                not_found_error(ERR_DID_NOT_FOUND, "DID not registered: " + did));

        DIDDocumentRecord empty;
        empty.did = dp::String(did.c_str());
        return dp::Result<DIDDocumentRecord, dp::Error>::ok(empty);
    }

    dp::Result<Receipt, dp::Error> Registry::storeCredential(const Address &caller, const std::string &credential_id,
                                                             const std::string &issuer_did,
                                                             const std::string &subject_did,
                                                             const std::string &data) {
        return submit(Operation::storeCredential(caller, credential_id, issuer_did, subject_did, data));
    }

    dp::Result<Credential, dp::Error> Registry::getCredential(const std::string &credential_id) const {
        std::shared_lock lock(mutex_);
        return state_.credentials.get(credential_id);
    }

    // ===========================================
    // Interaction log
    // ===========================================

    dp::Result<Receipt, dp::Error> Registry::recordInteraction(const Address &source, const Address &destination,
                                                               const std::string &source_identifier,
                                                               const std::string &destination_identifier,
                                                               const std::string &interaction_type,
                                                               const std::vector<uint8_t> &payload) {
        return submit(Operation::recordInteraction(source, destination, source_identifier, destination_identifier,
                                                   interaction_type, payload));
    }

    std::vector<Interaction> Registry::queryByIdentifier(const std::string &identifier) const {
        std::shared_lock lock(mutex_);
        return state_.interactions.queryByIdentifier(identifier);
    }

    std::vector<Interaction> Registry::queryBetween(const std::string &first, const std::string &second) const {
        std::shared_lock lock(mutex_);
        return state_.interactions.queryBetween(first, second);
    }

    size_t Registry::interactionCount() const {
        std::shared_lock lock(mutex_);
        return state_.interactions.size();
    }

    // ===========================================
    // Diagnostics
    // ===========================================

    void Registry::printSummary() const {
        std::shared_lock lock(mutex_);
        std::cout << "=== Registry Summary ===" << std::endl;
        std::cout << "Principals (" << state_.principals.principalCount() << "):" << std::endl;
        for (const auto &address : state_.principals.registeredAddresses()) {
            auto principal = state_.principals.findPrincipal(address);
            std::cout << "  " << address.toString() << " " << principal->getName() << " ("
                      << roleToString(principal->getRole()) << ")" << std::endl;
        }
        std::cout << "Roadside Units: " << state_.principals.roadsideUnitAddresses().size() << std::endl;
        std::cout << "Vehicles (" << state_.vehicles.size() << "):" << std::endl;
        for (const auto &vin : state_.vehicles.vins()) {
            auto vehicle = state_.vehicles.find(vin);
            std::cout << "  " << vin << " " << vehicle->getMake() << " " << vehicle->getModel()
                      << " owner=" << vehicle->current_owner.toString() << std::endl;
        }
        std::cout << "Registered DIDs: " << state_.principals.registeredDIDCount() << std::endl;
        std::cout << "DID Documents: " << state_.documents.size() << std::endl;
        std::cout << "Credentials: " << state_.credentials.size() << std::endl;
        std::cout << "Maintenance Records: " << state_.maintenance.recordCount() << std::endl;
        std::cout << "Insurance Policies: " << state_.maintenance.policyCount() << std::endl;
        std::cout << "Interactions: " << state_.interactions.size() << std::endl;
        std::cout << "Last Sequence: " << state_.last_sequence << std::endl;
        if (journal_) {
            std::cout << "Journal: " << journal_->getRecordCount() << " records, head "
                      << journal_->getHeadHash().c_str() << std::endl;
        }
    }

} // namespace motorid
