#include <doctest/doctest.h>

#include <motorid/registry/registry.hpp>

using namespace motorid;

// Test helper: Alice owns VIN001, Bob and Dave are mechanics, Acme insures
struct GarageFixture {
    Registry registry;
    Address alice{"0xalice"};
    Address bob{"0xbob"};
    Address carol{"0xcarol"};
    Address dave{"0xdave"};
    Address acme{"0xacme"};

    GarageFixture() {
        REQUIRE(registry.registerPrincipal(alice, "Alice", Role::Individual, "did:alice:e", "did:alice:w").is_ok());
        REQUIRE(registry.registerPrincipal(bob, "Bob", Role::Mechanic, "did:bob:e", "did:bob:w").is_ok());
        REQUIRE(registry.registerPrincipal(carol, "Carol", Role::Individual, "did:carol:e", "did:carol:w").is_ok());
        REQUIRE(registry.registerPrincipal(dave, "Dave", Role::Mechanic, "did:dave:e", "did:dave:w").is_ok());
        REQUIRE(registry.registerPrincipal(acme, "Acme", Role::InsuranceCompany, "did:acme:e", "did:acme:w").is_ok());
        REQUIRE(registry
                    .registerVehicle(alice, "VIN001", "did:alice:e", "did:car1:e", 2020, "Toyota", "Prius",
                                     "did:car1:w")
                    .is_ok());
    }
};

TEST_SUITE("Maintenance Tests") {

    TEST_CASE("Owner authorizes a mechanic") {
        GarageFixture f;
        CHECK_FALSE(f.registry.isMechanicAuthorized("VIN001", f.bob));

        auto receipt = f.registry.authorizeMechanic(f.alice, "VIN001", f.bob);
        REQUIRE(receipt.is_ok());
        CHECK(f.registry.isMechanicAuthorized("VIN001", f.bob));

        auto event = receipt.value().find(EventType::MechanicAuthorized);
        REQUIRE(event != nullptr);
        CHECK(event->attribute("mechanic") == "0xbob");
    }

    TEST_CASE("Authorization is idempotent") {
        GarageFixture f;
        REQUIRE(f.registry.authorizeMechanic(f.alice, "VIN001", f.bob).is_ok());
        auto again = f.registry.authorizeMechanic(f.alice, "VIN001", f.bob);
        REQUIRE(again.is_ok());
        CHECK(again.value().find(EventType::MechanicAuthorized)->attribute("new_grant") == "false");
        CHECK(f.registry.isMechanicAuthorized("VIN001", f.bob));
    }

    TEST_CASE("Authorization rules") {
        GarageFixture f;

        SUBCASE("Caller must own the vehicle") {
            auto result = f.registry.authorizeMechanic(f.carol, "VIN001", f.bob);
            REQUIRE(result.is_err());
            CHECK(errorKind(result.error()) == ErrorKind::Authorization);
        }

        SUBCASE("Target must be a mechanic") {
            auto result = f.registry.authorizeMechanic(f.alice, "VIN001", f.carol);
            REQUIRE(result.is_err());
            CHECK(errorKind(result.error()) == ErrorKind::Validation);
            CHECK(result.error().code == ERR_INVALID_ROLE);
        }

        SUBCASE("Unknown VIN") {
            auto result = f.registry.authorizeMechanic(f.alice, "VIN404", f.bob);
            REQUIRE(result.is_err());
            CHECK(errorKind(result.error()) == ErrorKind::NotFound);
        }

        CHECK_FALSE(f.registry.isMechanicAuthorized("VIN001", f.bob));
        CHECK_FALSE(f.registry.isMechanicAuthorized("VIN001", f.carol));
    }

    TEST_CASE("Authorized mechanic adds records") {
        GarageFixture f;
        REQUIRE(f.registry.authorizeMechanic(f.alice, "VIN001", f.bob).is_ok());

        REQUIRE(f.registry.addMaintenanceRecord(f.bob, "VIN001", "oil change", false).is_ok());
        auto added = f.registry.addMaintenanceRecord(f.bob, "VIN001", "brake pads", true);
        REQUIRE(added.is_ok());
        auto event = added.value().find(EventType::MaintenanceAdded);
        REQUIRE(event != nullptr);
        CHECK(event->attribute("description") == "brake pads");
        CHECK(event->attribute("critical") == "true");

        auto history = f.registry.getMaintenanceHistory("VIN001", f.bob);
        REQUIRE(history.size() == 2);
        CHECK(history[0].getDescription() == "oil change");
        CHECK_FALSE(history[0].critical);
        CHECK(history[1].getDescription() == "brake pads");
        CHECK(history[1].critical);

        // Set semantics for providers
        auto providers = f.registry.getVehicle("VIN001").value().getMaintenanceProviders();
        REQUIRE(providers.size() == 1);
        CHECK(providers[0] == f.bob);
    }

    TEST_CASE("Unauthorized mechanic is rejected") {
        GarageFixture f;
        REQUIRE(f.registry.authorizeMechanic(f.alice, "VIN001", f.bob).is_ok());
        REQUIRE(f.registry.addMaintenanceRecord(f.bob, "VIN001", "oil change", false).is_ok());

        auto result = f.registry.addMaintenanceRecord(f.dave, "VIN001", "tampering", true);
        REQUIRE(result.is_err());
        CHECK(errorKind(result.error()) == ErrorKind::Authorization);
        CHECK(result.error().code == ERR_MECHANIC_NOT_AUTHORIZED);

        CHECK(f.registry.getMaintenanceHistory("VIN001", f.bob).size() == 1);
        CHECK(f.registry.getMaintenanceHistory("VIN001", f.dave).empty());
        CHECK(f.registry.getVehicle("VIN001").value().getMaintenanceProviders().size() == 1);
    }

    TEST_CASE("Non-mechanic callers are rejected") {
        GarageFixture f;
        auto result = f.registry.addMaintenanceRecord(f.alice, "VIN001", "diy", false);
        REQUIRE(result.is_err());
        CHECK(errorKind(result.error()) == ErrorKind::Authorization);
        CHECK(result.error().code == ERR_ROLE_REQUIRED);
    }

    TEST_CASE("Record input checks") {
        GarageFixture f;
        REQUIRE(f.registry.authorizeMechanic(f.alice, "VIN001", f.bob).is_ok());

        auto unknown = f.registry.addMaintenanceRecord(f.bob, "VIN404", "oil change", false);
        REQUIRE(unknown.is_err());
        CHECK(errorKind(unknown.error()) == ErrorKind::NotFound);

        auto empty = f.registry.addMaintenanceRecord(f.bob, "VIN001", "", false);
        REQUIRE(empty.is_err());
        CHECK(errorKind(empty.error()) == ErrorKind::Validation);
    }

    TEST_CASE("Grant survives ownership transfer") {
        GarageFixture f;
        REQUIRE(f.registry.authorizeMechanic(f.alice, "VIN001", f.bob).is_ok());
        REQUIRE(f.registry.transferOwnership(f.alice, "VIN001", f.carol).is_ok());
        CHECK(f.registry.addMaintenanceRecord(f.bob, "VIN001", "inspection", false).is_ok());
    }
}

TEST_SUITE("Insurance Tests") {

    TEST_CASE("Insurer creates a policy") {
        GarageFixture f;
        auto receipt = f.registry.createInsurancePolicy(f.acme, "VIN001", 100, 200);
        REQUIRE(receipt.is_ok());
        CHECK(receipt.value().count(EventType::PolicyCreated) == 1);
        auto created = receipt.value().find(EventType::PolicyCreated);
        REQUIRE(created != nullptr);
        CHECK(created->attribute("start_date") == "100");
        CHECK(created->attribute("end_date") == "200");

        auto policy = f.registry.getInsurancePolicy("VIN001");
        REQUIRE(policy.is_ok());
        CHECK(policy.value().insurer == f.acme);
        CHECK(policy.value().vehicle_owner == f.alice);
        CHECK(policy.value().start_date == 100);
        CHECK(policy.value().end_date == 200);
        CHECK(policy.value().active);
        CHECK(f.registry.getVehicle("VIN001").value().current_insurer == f.acme);
    }

    TEST_CASE("Policy rules are validation errors") {
        GarageFixture f;

        SUBCASE("Caller must be an insurance company") {
            auto result = f.registry.createInsurancePolicy(f.alice, "VIN001", 100, 200);
            REQUIRE(result.is_err());
            CHECK(errorKind(result.error()) == ErrorKind::Validation);
        }

        SUBCASE("Vehicle must be registered") {
            auto result = f.registry.createInsurancePolicy(f.acme, "VIN404", 100, 200);
            REQUIRE(result.is_err());
            CHECK(errorKind(result.error()) == ErrorKind::Validation);
            CHECK(result.error().code == ERR_UNKNOWN_VEHICLE);
        }

        SUBCASE("Period must not be inverted") {
            auto result = f.registry.createInsurancePolicy(f.acme, "VIN001", 200, 100);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_INVALID_PERIOD);
        }

        CHECK(f.registry.getInsurancePolicy("VIN001").is_err());
        CHECK(f.registry.getVehicle("VIN001").value().current_insurer.isNull());
    }

    TEST_CASE("A new policy supersedes the old one") {
        GarageFixture f;
        REQUIRE(f.registry.registerPrincipal(Address("0xzenith"), "Zenith", Role::InsuranceCompany, "did:zen:e",
                                             "did:zen:w")
                    .is_ok());
        REQUIRE(f.registry.createInsurancePolicy(f.acme, "VIN001", 100, 200).is_ok());
        REQUIRE(f.registry.createInsurancePolicy(Address("0xzenith"), "VIN001", 300, 400).is_ok());

        auto policy = f.registry.getInsurancePolicy("VIN001").value();
        CHECK(policy.insurer == Address("0xzenith"));
        CHECK(policy.start_date == 300);
        CHECK(policy.active);
        CHECK(f.registry.getVehicle("VIN001").value().current_insurer == Address("0xzenith"));
    }

    TEST_CASE("Transfer deactivates but keeps the policy") {
        GarageFixture f;
        REQUIRE(f.registry.createInsurancePolicy(f.acme, "VIN001", 100, 200).is_ok());

        auto receipt = f.registry.transferOwnership(f.alice, "VIN001", f.carol);
        REQUIRE(receipt.is_ok());
        CHECK(receipt.value().find(EventType::OwnershipTransferred)->attribute("policy_deactivated") == "true");

        auto policy = f.registry.getInsurancePolicy("VIN001");
        REQUIRE(policy.is_ok());
        CHECK_FALSE(policy.value().active);
        CHECK(f.registry.getVehicle("VIN001").value().current_insurer == f.acme);
    }

    TEST_CASE("Missing policy") {
        GarageFixture f;
        auto policy = f.registry.getInsurancePolicy("VIN001");
        REQUIRE(policy.is_err());
        CHECK(policy.error().code == ERR_POLICY_NOT_FOUND);
    }
}

TEST_SUITE("Vehicle Lifecycle Scenario") {

    TEST_CASE("Register, service, insure and transfer") {
        Registry registry;
        Address alice("0xalice");
        Address bob("0xbob");
        Address acme("0xacme");
        Address carol("0xcarol");

        REQUIRE(registry.registerPrincipal(alice, "Alice", Role::Individual, "did:alice:e", "did:alice:w").is_ok());
        REQUIRE(registry.registerPrincipal(bob, "Bob", Role::Mechanic, "did:bob:e", "did:bob:w").is_ok());
        REQUIRE(registry.registerPrincipal(acme, "Acme", Role::InsuranceCompany, "did:acme:e", "did:acme:w").is_ok());
        REQUIRE(registry.registerPrincipal(carol, "Carol", Role::Individual, "did:carol:e", "did:carol:w").is_ok());

        REQUIRE(registry
                    .registerVehicle(alice, "VIN001", "did:alice:e", "did:vin001:e", 2019, "Honda", "Civic",
                                     "did:vin001:w")
                    .is_ok());
        REQUIRE(registry.authorizeMechanic(alice, "VIN001", bob).is_ok());
        REQUIRE(registry.addMaintenanceRecord(bob, "VIN001", "oil change", false).is_ok());
        CHECK(registry.getMaintenanceHistory("VIN001", bob).size() == 1);

        REQUIRE(registry.createInsurancePolicy(acme, "VIN001", 100, 200).is_ok());
        CHECK(registry.getVehicle("VIN001").value().current_insurer == acme);
        CHECK(registry.getInsurancePolicy("VIN001").value().active);

        REQUIRE(registry.transferOwnership(alice, "VIN001", carol).is_ok());
        auto vehicle = registry.getVehicle("VIN001").value();
        CHECK(vehicle.current_owner == carol);
        REQUIRE(vehicle.getPreviousOwners().size() == 1);
        CHECK(vehicle.getPreviousOwners()[0] == carol);
        CHECK_FALSE(registry.getInsurancePolicy("VIN001").value().active);

        // Unauthorized mechanic leaves state unchanged
        REQUIRE(registry.registerPrincipal(Address("0xdave"), "Dave", Role::Mechanic, "did:dave:e", "did:dave:w")
                    .is_ok());
        auto sequence_before = registry.lastSequence();
        auto rejected = registry.addMaintenanceRecord(Address("0xdave"), "VIN001", "unauthorized", false);
        REQUIRE(rejected.is_err());
        CHECK(errorKind(rejected.error()) == ErrorKind::Authorization);
        CHECK(registry.getMaintenanceHistory("VIN001", bob).size() == 1);
        CHECK(registry.lastSequence() == sequence_before);
    }
}
