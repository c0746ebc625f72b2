#pragma once

#include <algorithm>
#include <datapod/datapod.hpp>
#include <motorid/common/error.hpp>
#include <motorid/registry/types.hpp>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace motorid {

    /// Vehicle records keyed by VIN
    /// Secondary indexes: owner -> registration positions (keeps owner queries in VIN
    /// registration order) and vehicle DID -> VIN.
    class VehicleRegistry {
      public:
        VehicleRegistry() = default;

        inline bool exists(const std::string &vin) const { return vehicles_.find(vin) != vehicles_.end(); }

        inline const Vehicle *find(const std::string &vin) const {
            auto it = vehicles_.find(vin);
            return it == vehicles_.end() ? nullptr : &it->second;
        }

        inline dp::Result<Vehicle, dp::Error> get(const std::string &vin) const {
            auto vehicle = find(vin);
            if (vehicle == nullptr) {
                return dp::Result<Vehicle, dp::Error>::err(
                    not_found_error(ERR_VEHICLE_NOT_FOUND, "Vehicle not found: " + vin));
            }
            return dp::Result<Vehicle, dp::Error>::ok(*vehicle);
        }

        /// VIN of the vehicle owning an entity or wallet DID, nullptr when none
        inline const std::string *vinForDID(const std::string &did) const {
            auto it = did_to_vin_.find(did);
            return it == did_to_vin_.end() ? nullptr : &it->second;
        }

        inline bool isBound(const std::string &did) const { return did_to_vin_.find(did) != did_to_vin_.end(); }

        /// Vehicles currently owned by an address, in VIN registration order
        inline std::vector<Vehicle> ownedBy(const Address &owner) const {
            std::vector<Vehicle> result;
            auto it = owner_index_.find(owner);
            if (it == owner_index_.end())
                return result;

            for (size_t position : it->second) {
                result.push_back(vehicles_.at(vin_order_[position]));
            }
            return result;
        }

        /// VINs in registration order
        inline const std::vector<std::string> &vins() const { return vin_order_; }

        inline size_t size() const { return vehicles_.size(); }

        // === Mutation (validated by the caller) ===

        inline void add(const Vehicle &vehicle) {
            auto vin = vehicle.getVIN();
            size_t position = vin_order_.size();
            vin_order_.push_back(vin);
            positions_[vin] = position;
            vehicles_[vin] = vehicle;
            owner_index_[vehicle.current_owner].insert(position);
            did_to_vin_[vehicle.getEntityDID()] = vin;
            did_to_vin_[vehicle.getWalletDID()] = vin;
        }

        /// Move ownership; returns the vacated owner
        /// The new owner, not the vacated one, is appended to previous_owners.
        inline Address transfer(const std::string &vin, const Address &new_owner) {
            auto &vehicle = vehicles_.at(vin);
            size_t position = positions_.at(vin);

            Address previous = vehicle.current_owner;
            auto owned = owner_index_.find(previous);
            if (owned != owner_index_.end()) {
                owned->second.erase(position);
                if (owned->second.empty())
                    owner_index_.erase(owned);
            }

            vehicle.current_owner = new_owner;
            vehicle.previous_owners.push_back(new_owner);
            owner_index_[new_owner].insert(position);
            return previous;
        }

        inline void setInsurer(const std::string &vin, const Address &insurer) {
            vehicles_.at(vin).current_insurer = insurer;
        }

        /// Returns true when the mechanic was not yet a provider
        inline bool addMaintenanceProvider(const std::string &vin, const Address &mechanic) {
            auto &vehicle = vehicles_.at(vin);
            if (vehicle.hasMaintenanceProvider(mechanic))
                return false;
            vehicle.maintenance_providers.push_back(mechanic);
            return true;
        }

        inline void setConfig(const std::string &vin, const std::string &config) {
            vehicles_.at(vin).config = dp::String(config.c_str());
        }

      private:
        std::unordered_map<std::string, Vehicle> vehicles_;
        std::vector<std::string> vin_order_;
        std::unordered_map<std::string, size_t> positions_;
        std::unordered_map<Address, std::set<size_t>> owner_index_;
        std::unordered_map<std::string, std::string> did_to_vin_;
    };

} // namespace motorid
