#pragma once

#include <datapod/datapod.hpp>
#include <motorid/common/error.hpp>
#include <motorid/registry/types.hpp>
#include <string>
#include <unordered_map>

namespace motorid {

    /// Write-once credentials keyed by credential id
    class CredentialStore {
      public:
        CredentialStore() = default;

        inline bool contains(const std::string &credential_id) const {
            return credentials_.find(credential_id) != credentials_.end();
        }

        inline const Credential *find(const std::string &credential_id) const {
            auto it = credentials_.find(credential_id);
            return it == credentials_.end() ? nullptr : &it->second;
        }

        inline dp::Result<Credential, dp::Error> get(const std::string &credential_id) const {
            auto credential = find(credential_id);
            if (credential == nullptr) {
                return dp::Result<Credential, dp::Error>::err(
                    not_found_error(ERR_CREDENTIAL_NOT_FOUND, "Credential not found: " + credential_id));
            }
            return dp::Result<Credential, dp::Error>::ok(*credential);
        }

        inline size_t size() const { return credentials_.size(); }

        inline void put(const Credential &credential) { credentials_.emplace(credential.getId(), credential); }

      private:
        std::unordered_map<std::string, Credential> credentials_;
    };

} // namespace motorid
