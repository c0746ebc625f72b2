/// Registry Benchmark
/// Times the main registry operations against an isolated registry and prints
/// mean and median latency per operation. Pass a directory to benchmark a
/// journal-backed registry instead of an in-memory one.
///
/// Usage: benchmark [journal_dir] [vehicles]

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <motorid/motorid.hpp>
#include <numeric>
#include <string>
#include <vector>

using namespace motorid;

struct Timings {
    std::string name;
    std::vector<double> micros;
    size_t failures = 0;

    template <typename Fn> void measure(Fn &&fn) {
        auto start = std::chrono::steady_clock::now();
        bool ok = fn();
        auto end = std::chrono::steady_clock::now();
        micros.push_back(std::chrono::duration<double, std::micro>(end - start).count());
        if (!ok)
            ++failures;
    }

    void print() const {
        if (micros.empty()) {
            std::cout << std::left << std::setw(24) << name << " no samples" << std::endl;
            return;
        }
        std::vector<double> sorted = micros;
        std::sort(sorted.begin(), sorted.end());
        double mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) / sorted.size();
        double median = sorted[sorted.size() / 2];
        std::cout << std::left << std::setw(24) << name << std::right << std::setw(8) << sorted.size()
                  << std::setw(12) << std::fixed << std::setprecision(2) << mean << std::setw(12) << median
                  << std::setw(12) << sorted.back() << std::setw(8) << failures << std::endl;
    }
};

dp::Result<std::unique_ptr<Registry>, dp::Error> openRegistry(const std::string &journal_dir) {
    RegistryOptions options;
    if (!journal_dir.empty()) {
        std::filesystem::remove_all(journal_dir);
        options.journal_path = dp::String(journal_dir.c_str());
        options.sync_mode = storage::OpenOptions::Synchronous::NORMAL;
    }
    return Registry::open(options);
}

int main(int argc, char **argv) {
    std::string journal_dir = argc > 1 ? argv[1] : "";
    int vehicles = argc > 2 ? std::max(1, std::atoi(argv[2])) : 200;

    auto opened = openRegistry(journal_dir);
    if (opened.is_err()) {
        std::cerr << "Failed to open registry: " << describeError(opened.error()) << std::endl;
        return 1;
    }
    auto &registry = *opened.value();

    std::cout << "=== MotorID Benchmark ===" << std::endl;
    std::cout << "Mode: " << (registry.isPersistent() ? "journal at " + journal_dir : std::string("in-memory"))
              << std::endl;
    std::cout << "Vehicles: " << vehicles << std::endl;
    std::cout << std::endl;

    Timings principals{"registerPrincipal", {}, 0};
    Timings registrations{"registerVehicle", {}, 0};
    Timings verifications{"isValidDID", {}, 0};
    Timings requests{"data request", {}, 0};
    Timings responses{"data response", {}, 0};
    Timings history{"queryByIdentifier", {}, 0};

    Address service("0xservice");
    principals.measure([&]() {
        return registry
            .registerPrincipal(service, "Fleet Service", Role::Individual, "did:bench:service", "did:bench:service:w")
            .is_ok();
    });

    for (int i = 0; i < vehicles; ++i) {
        std::string id = std::to_string(i);
        Address owner("0xowner" + id);
        principals.measure([&]() {
            return registry
                .registerPrincipal(owner, "Owner " + id, Role::Individual, "did:bench:owner:" + id,
                                   "did:bench:owner:" + id + ":w")
                .is_ok();
        });
        registrations.measure([&]() {
            return registry
                .registerVehicle(owner, "VIN" + id, "did:bench:owner:" + id, "did:bench:car:" + id, 2024, "Bench",
                                 "Model", "did:bench:car:" + id + ":w")
                .is_ok();
        });
    }

    for (int i = 0; i < vehicles; ++i) {
        std::string did = "did:bench:car:" + std::to_string(i);
        verifications.measure([&]() { return registry.isValidDID(did); });
    }

    // Request/response pairs between each vehicle and the fleet service
    std::vector<uint8_t> request = {'g', 'e', 't'};
    std::vector<uint8_t> response(256, 0x2a);
    for (int i = 0; i < vehicles; ++i) {
        std::string vin = "VIN" + std::to_string(i);
        Address owner("0xowner" + std::to_string(i));
        requests.measure([&]() {
            return registry.recordInteraction(service, owner, "did:bench:service", vin, "data-request", request)
                .is_ok();
        });
        responses.measure([&]() {
            return registry.recordInteraction(owner, service, vin, "did:bench:service", "data-response", response)
                .is_ok();
        });
    }

    for (int i = 0; i < vehicles; ++i) {
        std::string vin = "VIN" + std::to_string(i);
        history.measure([&]() { return registry.queryByIdentifier(vin).size() == 2; });
    }

    std::cout << std::left << std::setw(24) << "operation" << std::right << std::setw(8) << "n" << std::setw(12)
              << "mean(us)" << std::setw(12) << "median(us)" << std::setw(12) << "max(us)" << std::setw(8)
              << "failed" << std::endl;
    principals.print();
    registrations.print();
    verifications.print();
    requests.print();
    responses.print();
    history.print();
    std::cout << std::endl;

    auto verified = registry.verifyJournal();
    if (verified.is_err()) {
        std::cerr << "Journal check failed: " << describeError(verified.error()) << std::endl;
        return 1;
    }
    std::cout << "Committed operations: " << registry.lastSequence() << std::endl;
    std::cout << "Journal chain: " << (verified.value() ? "valid" : "BROKEN") << std::endl;

    if (registry.isPersistent()) {
        auto start = std::chrono::steady_clock::now();
        opened.value().reset();
        RegistryOptions options;
        options.journal_path = dp::String(journal_dir.c_str());
        auto replayed = Registry::open(options);
        auto end = std::chrono::steady_clock::now();
        if (replayed.is_err()) {
            std::cerr << "Replay failed: " << describeError(replayed.error()) << std::endl;
            return 1;
        }
        std::cout << "Replayed " << replayed.value()->lastSequence() << " operations in "
                  << std::chrono::duration<double, std::milli>(end - start).count() << " ms" << std::endl;
    }

    return 0;
}
