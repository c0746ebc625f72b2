#include <doctest/doctest.h>

#include <csignal>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <motorid/registry/operation.hpp>
#include <motorid/storage/journal_store.hpp>
#include <string>
#include <sys/resource.h>

using namespace motorid;
using namespace motorid::storage;
using namespace datapod;

// Test helper: cleanup journal directory
struct TestJournal {
    std::string path;
    JournalStore store;

    explicit TestJournal(const std::string &name) : path(name + "_journal") { cleanup(); }

    ~TestJournal() {
        store.close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove_all(path);
        }
    }

    void open() { REQUIRE(store.open(String(path.c_str())).is_ok()); }
};

namespace {
    Vector<u8> bytes(const std::string &text) {
        Vector<u8> out;
        for (char c : text) {
            out.push_back(static_cast<u8>(c));
        }
        return out;
    }

    std::vector<char> readFile(const std::filesystem::path &file) {
        std::ifstream in(file, std::ios::binary);
        return std::vector<char>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    void writeFile(const std::filesystem::path &file, const std::vector<char> &data) {
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }
} // namespace

TEST_SUITE("Journal Store Tests") {

    // ===========================================
    // Hashing helpers
    // ===========================================

    TEST_CASE("Chain hash helpers") {
        SUBCASE("Genesis hash is all zero") {
            auto genesis = genesisHash();
            REQUIRE(genesis.size() == HASH_SIZE);
            for (auto b : genesis) {
                CHECK(b == 0);
            }
        }

        SUBCASE("Link hash depends on both inputs") {
            auto payload = bytes("payload");
            auto h1 = chainHash(genesisHash(), payload);
            auto h2 = chainHash(genesisHash(), payload);
            CHECK(h1.size() == HASH_SIZE);
            CHECK(sameBytes(h1, h2));

            CHECK_FALSE(sameBytes(h1, chainHash(genesisHash(), bytes("payload!"))));
            CHECK_FALSE(sameBytes(h1, chainHash(h1, payload)));
        }

        SUBCASE("Hex rendering") {
            Vector<u8> data = {0x00, 0xab, 0x10};
            CHECK(std::string(hashToHex(data).c_str()) == "00ab10");
        }
    }

    // ===========================================
    // Journal lifecycle
    // ===========================================

    TEST_CASE("Journal open and close") {
        TestJournal t("lifecycle");
        CHECK_FALSE(t.store.isOpen());
        CHECK(t.store.append(bytes("x"), 1).is_err());

        t.open();
        CHECK(t.store.isOpen());
        CHECK(std::filesystem::exists(t.store.journalPath()));
        CHECK(t.store.getRecordCount() == 0);
        CHECK(std::string(t.store.getHeadHash().c_str()) == std::string(hashToHex(genesisHash()).c_str()));

        t.store.close();
        CHECK_FALSE(t.store.isOpen());
        CHECK(t.store.readAll().is_err());
    }

    TEST_CASE("Committed records are chained") {
        TestJournal t("commit");
        t.open();

        {
            auto tx = t.store.beginTransaction();
            auto first = t.store.append(bytes("one"), 10);
            REQUIRE(first.is_ok());
            CHECK(first.value().sequence == 1);
            CHECK(sameBytes(first.value().prev_hash, genesisHash()));
            REQUIRE(tx->commit().is_ok());
        }
        {
            auto tx = t.store.beginTransaction();
            auto second = t.store.append(bytes("two"), 11);
            REQUIRE(second.is_ok());
            CHECK(second.value().sequence == 2);
            REQUIRE(tx->commit().is_ok());
        }

        CHECK(t.store.getRecordCount() == 2);

        auto records = t.store.readAll();
        REQUIRE(records.is_ok());
        REQUIRE(records.value().size() == 2);
        CHECK(sameBytes(records.value()[0].payload, bytes("one")));
        CHECK(records.value()[1].timestamp == 11);
        CHECK(sameBytes(records.value()[1].prev_hash, records.value()[0].hash));
        CHECK(std::string(t.store.getHeadHash().c_str()) == std::string(hashToHex(records.value()[1].hash).c_str()));

        auto verified = t.store.verifyChain();
        REQUIRE(verified.is_ok());
        CHECK(verified.value());
    }

    TEST_CASE("Uncommitted records are discarded") {
        TestJournal t("rollback");
        t.open();

        SUBCASE("Explicit rollback") {
            auto tx = t.store.beginTransaction();
            REQUIRE(t.store.append(bytes("gone"), 1).is_ok());
            tx->rollback();
        }

        SUBCASE("Guard destroyed without commit") {
            auto tx = t.store.beginTransaction();
            REQUIRE(t.store.append(bytes("gone"), 1).is_ok());
        }

        CHECK(t.store.getRecordCount() == 0);
        CHECK(t.store.readAll().value().empty());

        // The next record still starts the chain
        auto tx = t.store.beginTransaction();
        auto record = t.store.append(bytes("kept"), 2);
        REQUIRE(record.is_ok());
        CHECK(record.value().sequence == 1);
        REQUIRE(tx->commit().is_ok());
        CHECK(t.store.getRecordCount() == 1);
    }

    TEST_CASE("Reopen restores the head") {
        TestJournal t("reopen");
        t.open();
        {
            auto tx = t.store.beginTransaction();
            REQUIRE(t.store.append(bytes("a"), 1).is_ok());
            REQUIRE(t.store.append(bytes("b"), 2).is_ok());
            REQUIRE(tx->commit().is_ok());
        }
        std::string head(t.store.getHeadHash().c_str());
        t.store.close();

        JournalStore reopened;
        REQUIRE(reopened.open(String(t.path.c_str())).is_ok());
        CHECK(reopened.getRecordCount() == 2);
        CHECK(std::string(reopened.getHeadHash().c_str()) == head);

        auto tx = reopened.beginTransaction();
        auto next = reopened.append(bytes("c"), 3);
        REQUIRE(next.is_ok());
        CHECK(next.value().sequence == 3);
        REQUIRE(tx->commit().is_ok());
        CHECK(reopened.verifyChain().value());
        reopened.close();
    }

    TEST_CASE("Damaged journals are detected") {
        TestJournal t("damage");
        t.open();
        {
            auto tx = t.store.beginTransaction();
            REQUIRE(t.store.append(bytes("first"), 1).is_ok());
            REQUIRE(t.store.append(bytes("second"), 2).is_ok());
            REQUIRE(tx->commit().is_ok());
        }
        auto file = t.store.journalPath();
        t.store.close();

        SUBCASE("Altered payload breaks the chain") {
            auto data = readFile(file);
            REQUIRE_FALSE(data.empty());
            data.back() = static_cast<char>(data.back() ^ 0x01);
            writeFile(file, data);

            t.open();
            auto verified = t.store.verifyChain();
            REQUIRE(verified.is_ok());
            CHECK_FALSE(verified.value());
        }

        SUBCASE("Torn tail fails to open") {
            auto data = readFile(file);
            data.push_back(0x10);
            data.push_back(0x00);
            writeFile(file, data);

            auto opened = t.store.open(String(t.path.c_str()));
            REQUIRE(opened.is_err());
            CHECK(opened.error().code == ERR_JOURNAL_CORRUPT);
            CHECK(errorKind(opened.error()) == ErrorKind::Storage);
            CHECK_FALSE(t.store.isOpen());
        }
    }

    // ===========================================
    // Write failures and durability
    // ===========================================

    TEST_CASE("Failed write leaves the journal unchanged") {
        TestJournal t("partial");
        t.open();
        {
            auto tx = t.store.beginTransaction();
            REQUIRE(t.store.append(bytes("first"), 1).is_ok());
            REQUIRE(tx->commit().is_ok());
        }
        auto file = t.store.journalPath();
        auto committed = readFile(file);
        std::string head(t.store.getHeadHash().c_str());

        // Cap the file size so the next record is only partly written
        auto previous_handler = std::signal(SIGXFSZ, SIG_IGN);
        struct rlimit saved_limit;
        REQUIRE(getrlimit(RLIMIT_FSIZE, &saved_limit) == 0);
        struct rlimit capped = saved_limit;
        capped.rlim_cur = committed.size() + 8;
        REQUIRE(setrlimit(RLIMIT_FSIZE, &capped) == 0);

        bool appended = false;
        bool commit_failed = false;
        ErrorKind kind = ErrorKind::Validation;
        {
            auto tx = t.store.beginTransaction();
            appended = t.store.append(bytes(std::string(512, 'x')), 2).is_ok();
            auto commit = tx->commit();
            commit_failed = commit.is_err();
            if (commit_failed)
                kind = errorKind(commit.error());
        }

        setrlimit(RLIMIT_FSIZE, &saved_limit);
        std::signal(SIGXFSZ, previous_handler);

        REQUIRE(appended);
        REQUIRE(commit_failed);
        CHECK(kind == ErrorKind::Storage);
        CHECK(t.store.isOpen());
        CHECK(t.store.getRecordCount() == 1);
        CHECK(std::string(t.store.getHeadHash().c_str()) == head);
        CHECK(readFile(file) == committed);

        // The chain continues from the last committed record
        {
            auto tx = t.store.beginTransaction();
            auto next = t.store.append(bytes("second"), 3);
            REQUIRE(next.is_ok());
            CHECK(next.value().sequence == 2);
            REQUIRE(tx->commit().is_ok());
        }
        t.store.close();

        JournalStore reopened;
        REQUIRE(reopened.open(String(t.path.c_str())).is_ok());
        CHECK(reopened.getRecordCount() == 2);
        CHECK(reopened.verifyChain().value());
        reopened.close();
    }

    TEST_CASE("Full sync commits and reopens") {
        TestJournal t("fullsync");
        OpenOptions opts;
        opts.sync_mode = OpenOptions::Synchronous::FULL;
        REQUIRE(t.store.open(String(t.path.c_str()), opts).is_ok());

        for (int i = 0; i < 3; ++i) {
            auto tx = t.store.beginTransaction();
            REQUIRE(t.store.append(bytes("record " + std::to_string(i)), i).is_ok());
            REQUIRE(tx->commit().is_ok());
        }
        t.store.close();

        JournalStore reopened;
        REQUIRE(reopened.open(String(t.path.c_str()), opts).is_ok());
        CHECK(reopened.getRecordCount() == 3);
        auto records = reopened.readAll();
        REQUIRE(records.is_ok());
        CHECK(sameBytes(records.value()[2].payload, bytes("record 2")));
        CHECK(reopened.verifyChain().value());
        reopened.close();
    }

    // ===========================================
    // Operation encoding
    // ===========================================

    TEST_CASE("Operation encoding") {
        auto op = Operation::registerVehicle(Address("0xalice"), "VIN001", "did:alice:e", "did:car:e", 2021, "Volvo",
                                             "XC40", "did:car:w", "did:cred:1");
        op.timestamp = 1234;

        auto decoded = Operation::fromBytes(op.toBytes());
        REQUIRE(decoded.is_ok());
        const auto &copy = decoded.value();
        CHECK(copy.getType() == OperationType::RegisterVehicle);
        CHECK(copy.caller == Address("0xalice"));
        CHECK(copy.timestamp == 1234);
        CHECK(copy.getKey() == "VIN001");
        CHECK(copy.field(2) == "Volvo");
        CHECK(copy.field(5) == "did:cred:1");
        CHECK(copy.field(9).empty());
        CHECK(copy.number_a == 2021);
    }
}
