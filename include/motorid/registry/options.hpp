#pragma once

#include <datapod/datapod.hpp>
#include <functional>
#include <motorid/storage/journal_store.hpp>

namespace motorid {

    /// Unix seconds source for operation timestamps
    using Clock = std::function<dp::i64()>;

    /// Registry configuration
    struct RegistryOptions {
        bool verbose = false;   // print one line per committed or rejected operation
        dp::String journal_path; // journal directory, empty keeps the registry in memory only
        storage::OpenOptions::Synchronous sync_mode = storage::OpenOptions::Synchronous::NORMAL;
        bool verify_on_open = true; // check the hash chain before replaying
        Clock clock;                // unset uses the system clock

        auto members() { return std::tie(verbose, journal_path, sync_mode, verify_on_open); }
        auto members() const { return std::tie(verbose, journal_path, sync_mode, verify_on_open); }
    };

} // namespace motorid
