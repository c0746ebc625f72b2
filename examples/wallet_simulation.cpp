/// Wallet Simulation Demo
/// Vehicles drive along a road lined with roadside units. Each participant holds a
/// wallet key whose derived address is its registry identity. Nearby vehicles and
/// units exchange data, which is recorded as interactions; worn vehicles visit the
/// garage, and one vehicle is sold at the end.

#include <algorithm>
#include <cmath>
#include <iostream>
#include <motorid/motorid.hpp>
#include <random>
#include <string>
#include <vector>

using namespace motorid;

struct SimVehicle {
    std::string vin;
    std::string entity_did;
    std::string wallet_did;
    Address wallet;
    double position = 0.0;
    double speed = 0.0;
    double mileage = 0.0;
    bool serviced = false;
};

struct SimUnit {
    std::string name;
    std::string entity_did;
    Address address;
    double position = 0.0;
};

static constexpr double ROAD_LENGTH = 800.0;
static constexpr double INTERACTION_RADIUS = 100.0;
static constexpr double SERVICE_MILEAGE = 1500.0;

Address newWallet(const std::string &label) {
    auto key = WalletKey::generate();
    if (!key.is_ok()) {
        std::cerr << "Failed to generate key for " << label << std::endl;
        return Address(label);
    }
    auto address = key.value().address();
    if (!address.is_ok()) {
        std::cerr << "Failed to derive address for " << label << std::endl;
        return Address(label);
    }
    return address.value();
}

bool report(const std::string &what, const dp::Result<Receipt, dp::Error> &result) {
    if (result.is_err()) {
        std::cout << "  [x] " << what << ": " << describeError(result.error()) << std::endl;
        return false;
    }
    std::cout << "  [ok] " << what << " (#" << result.value().sequence << ")" << std::endl;
    return true;
}

std::vector<uint8_t> sensorPayload(const SimVehicle &vehicle) {
    std::string json = "{\"speed\":" + std::to_string(static_cast<int>(vehicle.speed)) +
                       ",\"position\":" + std::to_string(static_cast<int>(vehicle.position)) + "}";
    return std::vector<uint8_t>(json.begin(), json.end());
}

int main() {
    std::cout << "=== MotorID Wallet Simulation ===" << std::endl;
    std::cout << std::endl;

    Registry registry;
    size_t event_count = 0;
    registry.subscribe([&event_count](const RegistryEvent &) { ++event_count; });

    // === Part 1: Participants ===
    std::cout << "--- Part 1: Registering participants ---" << std::endl;

    Address maker = newWallet("maker");
    Address alice = newWallet("alice");
    Address bob = newWallet("bob");
    Address garage = newWallet("garage");
    Address insurer = newWallet("insurer");

    report("Manufacturer",
           registry.registerPrincipal(maker, "Northwind Motors", Role::VehicleManufacturer, "did:motorid:northwind",
                                      "did:motorid:northwind:wallet"));
    report("Alice", registry.registerPrincipal(alice, "Alice", Role::Individual, "did:motorid:alice",
                                               "did:motorid:alice:wallet"));
    report("Bob",
           registry.registerPrincipal(bob, "Bob", Role::Individual, "did:motorid:bob", "did:motorid:bob:wallet"));
    report("Garage", registry.registerPrincipal(garage, "Corner Garage", Role::Mechanic, "did:motorid:garage",
                                                "did:motorid:garage:wallet"));
    report("Insurer", registry.registerPrincipal(insurer, "Safe Roads Ltd", Role::InsuranceCompany,
                                                 "did:motorid:insurer", "did:motorid:insurer:wallet"));
    std::cout << std::endl;

    // === Part 2: Roadside units ===
    std::cout << "--- Part 2: Roadside units ---" << std::endl;

    std::vector<SimUnit> units;
    for (int i = 0; i < 3; ++i) {
        SimUnit unit;
        unit.name = "RSU-" + std::to_string(i + 1);
        unit.entity_did = "did:motorid:rsu:" + std::to_string(i + 1);
        unit.address = newWallet(unit.name);
        unit.position = 150.0 + 250.0 * i;
        report(unit.name, registry.registerRoadsideUnit(unit.address, unit.name,
                                                        "km " + std::to_string(static_cast<int>(unit.position)),
                                                        unit.entity_did, unit.entity_did + ":wallet"));
        units.push_back(unit);
    }
    std::cout << std::endl;

    // === Part 3: Vehicles ===
    std::cout << "--- Part 3: Vehicles ---" << std::endl;

    std::vector<SimVehicle> fleet;
    for (int i = 0; i < 3; ++i) {
        SimVehicle vehicle;
        vehicle.vin = "NWM00000000000" + std::to_string(100 + i);
        vehicle.entity_did = "did:motorid:car:" + std::to_string(i + 1);
        vehicle.wallet_did = vehicle.entity_did + ":wallet";
        vehicle.wallet = newWallet(vehicle.vin);
        vehicle.position = 60.0 * i;

        std::string credential_id = "birth-" + vehicle.vin;
        if (report("Vehicle " + vehicle.vin,
                   registry.registerVehicle(maker, vehicle.vin, "did:motorid:alice", vehicle.entity_did, 2024,
                                            "Northwind", "Volt " + std::to_string(i + 1), vehicle.wallet_did,
                                            credential_id))) {
            report("Birth credential",
                   registry.storeCredential(maker, credential_id, "did:motorid:northwind", vehicle.entity_did,
                                            "{\"vin\":\"" + vehicle.vin + "\",\"plant\":\"Leeds\"}"));
            fleet.push_back(vehicle);
        }
    }

    if (fleet.empty()) {
        std::cerr << "No vehicles registered" << std::endl;
        return 1;
    }
    report("Insure first vehicle",
           registry.createInsurancePolicy(insurer, fleet.front().vin, 1704067200, 1735689600));
    report("Authorize garage", registry.authorizeMechanic(alice, fleet.front().vin, garage));
    std::cout << std::endl;

    // === Part 4: Drive ===
    std::cout << "--- Part 4: Driving ---" << std::endl;

    std::mt19937 rng(7);
    std::uniform_real_distribution<double> accel(-5.0, 8.0);
    size_t exchanges = 0;

    for (int tick = 0; tick < 40; ++tick) {
        for (auto &vehicle : fleet) {
            vehicle.speed = std::max(0.0, std::min(120.0, vehicle.speed + accel(rng)));
            vehicle.position = std::fmod(vehicle.position + vehicle.speed * 0.2, ROAD_LENGTH);
            vehicle.mileage += vehicle.speed * 0.5;

            for (const auto &unit : units) {
                if (std::abs(vehicle.position - unit.position) > INTERACTION_RADIUS)
                    continue;
                auto recorded = registry.recordInteraction(vehicle.wallet, unit.address, vehicle.vin,
                                                           unit.entity_did, "sensor-report", sensorPayload(vehicle));
                if (recorded.is_ok())
                    ++exchanges;
            }

            if (!vehicle.serviced && vehicle.mileage > SERVICE_MILEAGE) {
                vehicle.serviced = true;
                // Only the first vehicle has an authorized garage
                std::string description =
                    "Scheduled service at " + std::to_string(static_cast<int>(vehicle.mileage)) + " km";
                report("Service " + vehicle.vin,
                       registry.addMaintenanceRecord(garage, vehicle.vin, description, false));
            }
        }
    }
    std::cout << "Recorded " << exchanges << " roadside exchanges" << std::endl;
    std::cout << std::endl;

    // === Part 5: Configuration and sale ===
    std::cout << "--- Part 5: Configuration and sale ---" << std::endl;

    const auto &sold = fleet.front();
    report("Eco profile", registry.updateVehicleConfig(alice, sold.wallet_did, "{\"drive_mode\":\"eco\"}"));
    report("Sell to Bob", registry.transferOwnership(alice, sold.vin, bob));
    report("Alice edits after sale",
           registry.updateVehicleConfig(alice, sold.wallet_did, "{\"drive_mode\":\"sport\"}"));

    auto vehicle = registry.getVehicle(sold.vin);
    if (vehicle.is_ok()) {
        std::cout << "Owner now: " << vehicle.value().current_owner.toString() << std::endl;
        std::cout << "Previous owners: " << vehicle.value().previous_owners.size() << std::endl;
    }
    auto policy = registry.getInsurancePolicy(sold.vin);
    if (policy.is_ok()) {
        std::cout << "Policy active after sale: " << (policy.value().active ? "yes" : "no") << std::endl;
    }
    std::cout << "Garage still authorized: " << (registry.isMechanicAuthorized(sold.vin, garage) ? "yes" : "no")
              << std::endl;
    std::cout << std::endl;

    // === Part 6: Queries ===
    std::cout << "--- Part 6: Queries ---" << std::endl;

    for (const auto &unit : units) {
        std::cout << unit.name << " saw " << registry.queryByIdentifier(unit.entity_did).size() << " reports"
                  << std::endl;
    }
    std::cout << "Alice owns " << registry.getVehiclesByOwnerDID("did:motorid:alice").size() << " vehicles"
              << std::endl;
    std::cout << "Bob owns " << registry.getVehiclesByOwnerDID("did:motorid:bob").size() << " vehicles" << std::endl;
    std::cout << "Service history entries for " << sold.vin << ": "
              << registry.getMaintenanceHistory(sold.vin, garage).size() << std::endl;
    std::cout << "Events delivered: " << event_count << std::endl;
    std::cout << std::endl;

    registry.printSummary();
    return 0;
}
