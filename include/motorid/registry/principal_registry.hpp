#pragma once

#include <datapod/datapod.hpp>
#include <motorid/common/error.hpp>
#include <motorid/registry/types.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace motorid {

    /// Principals, roadside units and the DID directory
    /// Principals and roadside units live in separate namespaces keyed by address. Each
    /// registration binds two DIDs to the registering address; bindings are permanent.
    class PrincipalRegistry {
      public:
        PrincipalRegistry() = default;

        // === Principals ===

        inline bool isPrincipal(const Address &address) const {
            auto it = principals_.find(address);
            return it != principals_.end() && it->second.registered;
        }

        /// nullptr when the address is not registered
        inline const Principal *findPrincipal(const Address &address) const {
            auto it = principals_.find(address);
            return it == principals_.end() ? nullptr : &it->second;
        }

        inline dp::Result<Principal, dp::Error> getPrincipal(const Address &address) const {
            auto principal = findPrincipal(address);
            if (principal == nullptr) {
                return dp::Result<Principal, dp::Error>::err(
                    not_found_error(ERR_PRINCIPAL_NOT_FOUND, "Principal not found: " + address.toString()));
            }
            return dp::Result<Principal, dp::Error>::ok(*principal);
        }

        /// Addresses in registration order
        inline const std::vector<Address> &registeredAddresses() const { return registration_order_; }

        inline size_t principalCount() const { return principals_.size(); }

        // === Roadside units ===

        inline bool isRoadsideUnit(const Address &address) const { return units_.find(address) != units_.end(); }

        inline const RoadsideUnit *findRoadsideUnit(const Address &address) const {
            auto it = units_.find(address);
            return it == units_.end() ? nullptr : &it->second;
        }

        inline dp::Result<RoadsideUnit, dp::Error> getRoadsideUnit(const Address &address) const {
            auto unit = findRoadsideUnit(address);
            if (unit == nullptr) {
                return dp::Result<RoadsideUnit, dp::Error>::err(
                    not_found_error(ERR_UNIT_NOT_FOUND, "Roadside unit not found: " + address.toString()));
            }
            return dp::Result<RoadsideUnit, dp::Error>::ok(*unit);
        }

        /// Unit bound to a DID, nullptr when none
        inline const RoadsideUnit *findRoadsideUnitByDID(const std::string &did) const {
            auto it = did_to_unit_.find(did);
            if (it == did_to_unit_.end())
                return nullptr;
            return findRoadsideUnit(it->second);
        }

        inline const std::vector<Address> &roadsideUnitAddresses() const { return unit_order_; }

        // === DID directory ===

        inline bool isRegistered(const std::string &did) const {
            return registered_dids_.find(did) != registered_dids_.end();
        }

        /// True when the DID is bound to a principal or roadside unit
        inline bool isBound(const std::string &did) const {
            return did_to_address_.find(did) != did_to_address_.end() || did_to_unit_.find(did) != did_to_unit_.end();
        }

        inline dp::Result<Address, dp::Error> resolveAddress(const std::string &did) const {
            auto it = did_to_address_.find(did);
            if (it != did_to_address_.end())
                return dp::Result<Address, dp::Error>::ok(it->second);

            auto unit_it = did_to_unit_.find(did);
            if (unit_it != did_to_unit_.end())
                return dp::Result<Address, dp::Error>::ok(unit_it->second);

            return dp::Result<Address, dp::Error>::err(not_found_error(ERR_DID_NOT_FOUND, "DID not bound: " + did));
        }

        /// Principal bound to a DID, nullptr when none
        inline const Principal *findPrincipalByDID(const std::string &did) const {
            auto it = did_to_address_.find(did);
            if (it == did_to_address_.end())
                return nullptr;
            return findPrincipal(it->second);
        }

        inline size_t registeredDIDCount() const { return registered_dids_.size(); }

        // === Mutation (validated by the caller) ===

        inline void addPrincipal(const Principal &principal) {
            principals_[principal.address] = principal;
            registration_order_.push_back(principal.address);
            did_to_address_[principal.getEntityDID()] = principal.address;
            did_to_address_[principal.getWalletDID()] = principal.address;
            markRegistered(principal.getEntityDID());
            markRegistered(principal.getWalletDID());
        }

        inline void addRoadsideUnit(const RoadsideUnit &unit) {
            units_[unit.address] = unit;
            unit_order_.push_back(unit.address);
            did_to_unit_[unit.getEntityDID()] = unit.address;
            did_to_unit_[unit.getWalletDID()] = unit.address;
            markRegistered(unit.getEntityDID());
            markRegistered(unit.getWalletDID());
        }

        inline void setRoadsideUnitActive(const Address &address, bool active) {
            auto it = units_.find(address);
            if (it != units_.end())
                it->second.active = active;
        }

        /// Returns true when the DID was not registered before
        inline bool markRegistered(const std::string &did) { return registered_dids_.insert(did).second; }

      private:
        std::unordered_map<Address, Principal> principals_;
        std::vector<Address> registration_order_;

        std::unordered_map<Address, RoadsideUnit> units_;
        std::vector<Address> unit_order_;

        std::unordered_map<std::string, Address> did_to_address_;
        std::unordered_map<std::string, Address> did_to_unit_;
        std::unordered_set<std::string> registered_dids_;
    };

} // namespace motorid
