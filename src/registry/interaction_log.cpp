#include <motorid/registry/interaction_log.hpp>

namespace motorid {

    dp::u64 InteractionLog::append(Interaction interaction) {
        size_t position = entries_.size();
        interaction.sequence = static_cast<dp::u64>(position);

        auto source = interaction.getSourceIdentifier();
        auto destination = interaction.getDestinationIdentifier();
        entries_.push_back(std::move(interaction));

        indexIdentifier(source, position);
        if (destination != source)
            indexIdentifier(destination, position);

        return static_cast<dp::u64>(position);
    }

    void InteractionLog::indexIdentifier(const std::string &identifier, size_t position) {
        index_[identifier].push_back(position);
    }

    std::vector<Interaction> InteractionLog::queryByIdentifier(const std::string &identifier) const {
        std::vector<Interaction> result;
        auto it = index_.find(identifier);
        if (it == index_.end())
            return result;

        result.reserve(it->second.size());
        for (size_t position : it->second)
            result.push_back(entries_[position]);
        return result;
    }

    std::vector<Interaction> InteractionLog::queryBetween(const std::string &first, const std::string &second) const {
        std::vector<Interaction> result;

        // Walk the shorter position list; both are already in log order
        auto first_it = index_.find(first);
        auto second_it = index_.find(second);
        if (first_it == index_.end() || second_it == index_.end())
            return result;

        const auto &positions = first_it->second.size() <= second_it->second.size() ? first_it->second
                                                                                      : second_it->second;
        for (size_t position : positions) {
            const auto &entry = entries_[position];
            auto source = entry.getSourceIdentifier();
            auto destination = entry.getDestinationIdentifier();
            if ((source == first && destination == second) || (source == second && destination == first))
                result.push_back(entry);
        }
        return result;
    }

    std::vector<Interaction> InteractionLog::since(dp::u64 from) const {
        std::vector<Interaction> result;
        for (size_t position = static_cast<size_t>(from); position < entries_.size(); ++position)
            result.push_back(entries_[position]);
        return result;
    }

    size_t InteractionLog::size() const { return entries_.size(); }

    bool InteractionLog::empty() const { return entries_.empty(); }

} // namespace motorid
