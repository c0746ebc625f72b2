#pragma once

#include <datapod/datapod.hpp>
#include <map>
#include <motorid/common/error.hpp>
#include <motorid/registry/types.hpp>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace motorid {

    /// Mechanic authorizations, maintenance history and insurance policies
    class MaintenanceLedger {
      public:
        MaintenanceLedger() = default;

        // === Mechanics ===

        inline bool isAuthorized(const std::string &vin, const Address &mechanic) const {
            auto it = authorizations_.find(vin);
            return it != authorizations_.end() && it->second.count(mechanic) > 0;
        }

        /// Records appended by one mechanic for one vehicle, oldest first
        inline std::vector<MaintenanceRecord> history(const std::string &vin, const Address &mechanic) const {
            auto it = history_.find({vin, mechanic});
            if (it == history_.end())
                return {};
            return it->second;
        }

        inline size_t recordCount() const { return record_count_; }

        // === Insurance ===

        inline const InsurancePolicy *findPolicy(const std::string &vin) const {
            auto it = policies_.find(vin);
            return it == policies_.end() ? nullptr : &it->second;
        }

        inline dp::Result<InsurancePolicy, dp::Error> getPolicy(const std::string &vin) const {
            auto policy = findPolicy(vin);
            if (policy == nullptr) {
                return dp::Result<InsurancePolicy, dp::Error>::err(
                    not_found_error(ERR_POLICY_NOT_FOUND, "No insurance policy for vehicle: " + vin));
            }
            return dp::Result<InsurancePolicy, dp::Error>::ok(*policy);
        }

        inline size_t policyCount() const { return policies_.size(); }

        // === Mutation (validated by the caller) ===

        /// Idempotent; returns true when the grant is new
        inline bool authorize(const std::string &vin, const Address &mechanic) {
            return authorizations_[vin].insert(mechanic).second;
        }

        inline void append(const std::string &vin, const MaintenanceRecord &record) {
            history_[{vin, record.mechanic}].push_back(record);
            ++record_count_;
        }

        /// Replaces any earlier policy for the VIN
        inline void putPolicy(const InsurancePolicy &policy) { policies_[policy.getVIN()] = policy; }

        /// Returns true when an active policy was deactivated
        inline bool deactivatePolicy(const std::string &vin) {
            auto it = policies_.find(vin);
            if (it == policies_.end() || !it->second.active)
                return false;
            it->second.active = false;
            return true;
        }

      private:
        std::unordered_map<std::string, std::set<Address>> authorizations_;
        std::map<std::pair<std::string, Address>, std::vector<MaintenanceRecord>> history_;
        std::unordered_map<std::string, InsurancePolicy> policies_;
        size_t record_count_ = 0;
    };

} // namespace motorid
