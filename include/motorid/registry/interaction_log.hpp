#pragma once

#include <datapod/datapod.hpp>
#include <motorid/registry/types.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace motorid {

    /// Append-only log of inter-entity interactions
    /// Entries are never mutated or removed. An identifier index (identifier -> ordered
    /// log positions) is updated on every append so that queries do not scan the log.
    class InteractionLog {
      public:
        InteractionLog() = default;

        /// Append an entry; its sequence is set to the log position
        dp::u64 append(Interaction interaction);

        /// All entries naming the identifier as source or destination, in log order
        std::vector<Interaction> queryByIdentifier(const std::string &identifier) const;

        /// All entries between the unordered pair {first, second}, in log order
        std::vector<Interaction> queryBetween(const std::string &first, const std::string &second) const;

        /// Entries in [from, size()), in log order
        std::vector<Interaction> since(dp::u64 from) const;

        size_t size() const;

        bool empty() const;

      private:
        void indexIdentifier(const std::string &identifier, size_t position);

        std::vector<Interaction> entries_;
        std::unordered_map<std::string, std::vector<size_t>> index_;
    };

} // namespace motorid
