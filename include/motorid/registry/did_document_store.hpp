#pragma once

#include <datapod/datapod.hpp>
#include <motorid/registry/types.hpp>
#include <string>
#include <unordered_map>

namespace motorid {

    /// DID documents keyed by DID
    /// Each record keeps the latest document bytes.
    class DIDDocumentStore {
      public:
        DIDDocumentStore() = default;

        inline bool contains(const std::string &did) const { return documents_.find(did) != documents_.end(); }

        inline const DIDDocumentRecord *find(const std::string &did) const {
            auto it = documents_.find(did);
            return it == documents_.end() ? nullptr : &it->second;
        }

        inline size_t size() const { return documents_.size(); }

        // === Mutation (validated by the caller) ===

        /// Returns true when the document was created rather than updated
        inline bool upsert(const std::string &did, const dp::Vector<dp::u8> &document, dp::i64 timestamp,
                           const Address &controller) {
            bool created = !contains(did);
            auto &record = documents_[did];
            record.did = dp::String(did.c_str());
            record.document = document;
            record.timestamp = timestamp;
            record.active = true;
            record.controller = controller;
            return created;
        }

        inline void revoke(const std::string &did, dp::i64 timestamp) {
            auto it = documents_.find(did);
            if (it == documents_.end())
                return;
            it->second.active = false;
            it->second.timestamp = timestamp;
        }

      private:
        std::unordered_map<std::string, DIDDocumentRecord> documents_;
    };

} // namespace motorid
