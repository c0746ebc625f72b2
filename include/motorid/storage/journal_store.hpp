#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <keylock/keylock.hpp>
#include <memory>
#include <motorid/common/error.hpp>
#include <string>
#include <system_error>
#include <unistd.h>

namespace motorid::storage {

    using namespace datapod;

    // ===========================================
    // Utility functions
    // ===========================================

    inline i64 currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    inline Vector<u8> computeSHA256(const Vector<u8> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        std::vector<uint8_t> input(data.begin(), data.end());
        auto result = crypto.hash(input);
        if (!result.success) {
            return Vector<u8>{};
        }
        return Vector<u8>(result.data.begin(), result.data.end());
    }

    inline String hashToHex(const Vector<u8> &hash) {
        std::vector<uint8_t> input(hash.begin(), hash.end());
        return String(keylock::keylock::to_hex(input).c_str());
    }

    /// Chain link: SHA-256(prev_hash || payload)
    inline Vector<u8> chainHash(const Vector<u8> &prev_hash, const Vector<u8> &payload) {
        Vector<u8> input(prev_hash.begin(), prev_hash.end());
        for (auto byte : payload) {
            input.push_back(byte);
        }
        return computeSHA256(input);
    }

    inline bool sameBytes(const Vector<u8> &a, const Vector<u8> &b) {
        if (a.size() != b.size())
            return false;
        for (usize i = 0; i < a.size(); ++i) {
            if (a[i] != b[i])
                return false;
        }
        return true;
    }

    constexpr usize HASH_SIZE = 32;

    inline Vector<u8> genesisHash() {
        Vector<u8> hash;
        for (usize i = 0; i < HASH_SIZE; ++i) {
            hash.push_back(0);
        }
        return hash;
    }

    // ===========================================
    // Records
    // ===========================================

    /// One committed operation in operations.dat
    struct JournalRecord {
        u64 sequence = 0; // 1-based, contiguous
        i64 timestamp = 0;
        Vector<u8> prev_hash;
        Vector<u8> hash;
        Vector<u8> payload; // serialized Operation

        auto members() { return std::tie(sequence, timestamp, prev_hash, hash, payload); }
        auto members() const { return std::tie(sequence, timestamp, prev_hash, hash, payload); }
    };

    /// Storage configuration options
    /// Every commit hands its records to the OS; FULL also fsyncs operations.dat before
    /// the commit returns.
    struct OpenOptions {
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        auto members() { return std::tie(sync_mode); }
        auto members() const { return std::tie(sync_mode); }
    };

    // ===========================================
    // JournalStore - append-only, hash-chained operation log
    // ===========================================

    class JournalStore {
      public:
        inline JournalStore() : is_open_(false), sync_mode_(OpenOptions::Synchronous::NORMAL) {}

        inline ~JournalStore() { close(); }

        // Non-copyable, movable
        JournalStore(const JournalStore &) = delete;
        JournalStore &operator=(const JournalStore &) = delete;

        inline JournalStore(JournalStore &&other) noexcept
            : base_path_(std::move(other.base_path_)), is_open_(other.is_open_), sync_mode_(other.sync_mode_),
              record_count_(other.record_count_), head_hash_(std::move(other.head_hash_)),
              pending_(std::move(other.pending_)) {
            other.is_open_ = false;
        }

        inline JournalStore &operator=(JournalStore &&other) noexcept {
            if (this != &other) {
                close();
                base_path_ = std::move(other.base_path_);
                is_open_ = other.is_open_;
                sync_mode_ = other.sync_mode_;
                record_count_ = other.record_count_;
                head_hash_ = std::move(other.head_hash_);
                pending_ = std::move(other.pending_);
                other.is_open_ = false;
            }
            return *this;
        }

        /// Open or create the journal directory
        /// Fails with a corrupt-journal error when operations.dat ends in a torn record.
        inline Result<void, Error> open(const String &path, const OpenOptions &opts = OpenOptions{}) {
            try {
                base_path_ = std::string(path.c_str());
                sync_mode_ = opts.sync_mode;

                std::filesystem::create_directories(base_path_);
                if (!std::filesystem::exists(journalPath())) {
                    std::ofstream(journalPath(), std::ios::binary).close();
                }

                auto loaded = loadHead();
                if (loaded.is_err()) {
                    is_open_ = false;
                    return loaded;
                }

                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return Result<void, Error>::err(storage_error(e.what()));
            }
        }

        inline void close() {
            if (is_open_) {
                pending_.clear();
                is_open_ = false;
            }
        }

        inline bool isOpen() const { return is_open_; }

        inline std::filesystem::path journalPath() const { return base_path_ / "operations.dat"; }

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        /// Stages appended records; nothing reaches disk until commit()
        class TxGuard {
          public:
            inline explicit TxGuard(JournalStore &store) : store_(store), committed_(false) {
                store_.pending_.clear();
            }

            inline ~TxGuard() {
                if (!committed_) {
                    store_.pending_.clear();
                }
            }

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            inline Result<void, Error> commit() {
                if (committed_)
                    return Result<void, Error>::ok();
                committed_ = true;
                return store_.flushPending();
            }

            inline void rollback() {
                if (!committed_) {
                    store_.pending_.clear();
                    committed_ = true;
                }
            }

          private:
            JournalStore &store_;
            bool committed_;
        };

        inline std::unique_ptr<TxGuard> beginTransaction() { return std::make_unique<TxGuard>(*this); }

        // ===========================================
        // Journal operations
        // ===========================================

        /// Stage one payload as the next chain link
        inline Result<JournalRecord, Error> append(const Vector<u8> &payload, i64 timestamp) {
            if (!is_open_)
                return Result<JournalRecord, Error>::err(store_not_open());

            JournalRecord record;
            record.sequence = record_count_ + pending_.size() + 1;
            record.timestamp = timestamp;
            record.prev_hash = pending_.empty() ? head_hash_ : pending_.back().hash;
            record.payload = payload;
            record.hash = chainHash(record.prev_hash, record.payload);
            if (record.hash.size() != HASH_SIZE)
                return Result<JournalRecord, Error>::err(storage_error("Journal hash failed"));

            pending_.push_back(record);
            return Result<JournalRecord, Error>::ok(record);
        }

        /// All committed records in sequence order
        inline Result<Vector<JournalRecord>, Error> readAll() const {
            if (!is_open_)
                return Result<Vector<JournalRecord>, Error>::err(store_not_open());
            return readAllRecords();
        }

        /// Recompute every link; false when a record was altered or reordered
        inline Result<bool, Error> verifyChain() const {
            auto records = readAll();
            if (records.is_err())
                return Result<bool, Error>::err(records.error());

            Vector<u8> expected_prev = genesisHash();
            u64 expected_sequence = 1;
            for (const auto &record : records.value()) {
                if (record.sequence != expected_sequence || !sameBytes(record.prev_hash, expected_prev))
                    return Result<bool, Error>::ok(false);
                if (!sameBytes(chainHash(record.prev_hash, record.payload), record.hash))
                    return Result<bool, Error>::ok(false);
                expected_prev = record.hash;
                ++expected_sequence;
            }
            return Result<bool, Error>::ok(true);
        }

        // ===========================================
        // Statistics
        // ===========================================

        inline u64 getRecordCount() const { return is_open_ ? record_count_ : 0; }

        inline String getHeadHash() const { return hashToHex(head_hash_); }

      private:
        // ===========================================
        // File I/O with datapod serialization
        // ===========================================

        inline void appendRecord(std::ofstream &out, const JournalRecord &record) {
            JournalRecord mutable_record = record;
            auto buffer = datapod::serialize(mutable_record);
            u32 len = static_cast<u32>(buffer.size());

            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
        }

        inline Result<Vector<JournalRecord>, Error> readAllRecords() const {
            Vector<JournalRecord> records;
            std::ifstream in(journalPath(), std::ios::binary);
            if (!in)
                return Result<Vector<JournalRecord>, Error>::err(storage_error("Failed to open journal for reading"));

            while (true) {
                u32 len;
                in.read(reinterpret_cast<char *>(&len), sizeof(len));
                if (in.gcount() == 0)
                    break;
                if (!in)
                    return Result<Vector<JournalRecord>, Error>::err(journal_corrupt("Torn record length"));

                ByteBuf data(len);
                in.read(reinterpret_cast<char *>(data.data()), len);
                if (!in)
                    return Result<Vector<JournalRecord>, Error>::err(journal_corrupt("Torn record body"));

                try {
                    records.push_back(datapod::deserialize<Mode::NONE, JournalRecord>(data));
                } catch (const std::exception &e) {
                    return Result<Vector<JournalRecord>, Error>::err(journal_corrupt(e.what()));
                }
            }

            return Result<Vector<JournalRecord>, Error>::ok(std::move(records));
        }

        inline Result<void, Error> loadHead() {
            record_count_ = 0;
            head_hash_ = genesisHash();
            pending_.clear();

            auto records = readAllRecords();
            if (records.is_err())
                return Result<void, Error>::err(records.error());

            for (const auto &record : records.value()) {
                head_hash_ = record.hash;
                ++record_count_;
            }
            return Result<void, Error>::ok();
        }

        /// Appends the pending records
        /// On any failure the file is cut back to its last committed size, so a partial
        /// write never survives to the next open.
        inline Result<void, Error> flushPending() {
            if (pending_.empty())
                return Result<void, Error>::ok();

            std::error_code ec;
            auto committed_size = std::filesystem::file_size(journalPath(), ec);
            if (ec) {
                pending_.clear();
                return Result<void, Error>::err(storage_error("Failed to stat journal: " + ec.message()));
            }

            bool written = false;
            std::string failure = "Journal write failed";
            try {
                std::ofstream out(journalPath(), std::ios::binary | std::ios::app);
                if (!out) {
                    pending_.clear();
                    return Result<void, Error>::err(storage_error("Failed to open journal for writing"));
                }

                for (const auto &record : pending_) {
                    appendRecord(out, record);
                }
                out.close();
                written = !out.fail();
            } catch (const std::exception &e) {
                failure = e.what();
            }

            if (written && sync_mode_ == OpenOptions::Synchronous::FULL) {
                written = syncToDisk();
                if (!written)
                    failure = "Journal fsync failed";
            }

            if (!written) {
                pending_.clear();
                auto restored = truncateTo(committed_size);
                if (restored.is_err())
                    return restored;
                return Result<void, Error>::err(storage_error(failure));
            }

            head_hash_ = pending_.back().hash;
            record_count_ += pending_.size();
            pending_.clear();
            return Result<void, Error>::ok();
        }

        /// Drops everything past the last committed record
        /// The store closes when that fails, since the tail is then unknown.
        inline Result<void, Error> truncateTo(std::uintmax_t size) {
            std::error_code ec;
            std::filesystem::resize_file(journalPath(), size, ec);
            if (ec) {
                is_open_ = false;
                return Result<void, Error>::err(
                    storage_error("Failed to discard partial journal write: " + ec.message()));
            }
            return Result<void, Error>::ok();
        }

        inline bool syncToDisk() const {
            int fd = ::open(journalPath().c_str(), O_WRONLY);
            if (fd < 0)
                return false;
            bool synced = ::fsync(fd) == 0;
            ::close(fd);
            return synced;
        }

        // ===========================================
        // Member variables
        // ===========================================

        std::filesystem::path base_path_;
        bool is_open_;
        OpenOptions::Synchronous sync_mode_;

        u64 record_count_ = 0;
        Vector<u8> head_hash_ = genesisHash();

        // Pending writes
        Vector<JournalRecord> pending_;
    };

} // namespace motorid::storage
