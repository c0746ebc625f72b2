#include <doctest/doctest.h>

#include <filesystem>
#include <motorid/registry/registry.hpp>
#include <string>

using namespace motorid;

// Test helper: a manufacturer issuing to an owner
struct CredentialFixture {
    Registry registry;
    Address maker{"0xmaker"};
    Address alice{"0xalice"};

    CredentialFixture() {
        REQUIRE(registry.registerPrincipal(maker, "Maker", Role::VehicleManufacturer, "did:maker:e", "did:maker:w")
                    .is_ok());
        REQUIRE(registry.registerPrincipal(alice, "Alice", Role::Individual, "did:alice:e", "did:alice:w").is_ok());
    }
};

TEST_SUITE("Credential Store Tests") {

    TEST_CASE("Store and read back a credential") {
        CredentialFixture f;
        auto receipt = f.registry.storeCredential(f.maker, "cred-1", "did:maker:e", "did:alice:e", "{\"vin\":1}");
        REQUIRE(receipt.is_ok());
        CHECK(receipt.value().count(EventType::CredentialStored) == 1);

        auto credential = f.registry.getCredential("cred-1");
        REQUIRE(credential.is_ok());
        CHECK(credential.value().getId() == "cred-1");
        CHECK(credential.value().getSubjectDID() == "did:alice:e");
        CHECK(credential.value().getData() == "{\"vin\":1}");
    }

    TEST_CASE("Binary data is kept byte for byte") {
        CredentialFixture f;
        std::string data("ab\0cd", 5);
        std::string leading("\0\x01\x02", 3);

        REQUIRE(f.registry.storeCredential(f.maker, "cred-bin", "did:maker:e", "did:alice:e", data).is_ok());
        REQUIRE(f.registry.storeCredential(f.maker, "cred-lead", "did:maker:e", "did:alice:e", leading).is_ok());

        auto stored = f.registry.getCredential("cred-bin").value().getData();
        CHECK(stored.size() == 5);
        CHECK(stored == data);
        CHECK(f.registry.getCredential("cred-lead").value().getData() == leading);
    }

    TEST_CASE("Binary data survives replay") {
        std::string path = "credential_replay_registry";
        std::filesystem::remove_all(path);
        RegistryOptions options;
        options.journal_path = dp::String(path.c_str());
        std::string data("{\"k\":\"\0\"}", 9);

        {
            auto opened = Registry::open(options);
            REQUIRE(opened.is_ok());
            auto &registry = *opened.value();
            Address maker("0xmaker");
            REQUIRE(registry
                        .registerPrincipal(maker, "Maker", Role::VehicleManufacturer, "did:maker:e", "did:maker:w")
                        .is_ok());
            REQUIRE(registry.storeCredential(maker, "cred-1", "did:maker:e", "did:maker:w", data).is_ok());
        }

        auto reopened = Registry::open(options);
        REQUIRE(reopened.is_ok());
        auto credential = reopened.value()->getCredential("cred-1");
        REQUIRE(credential.is_ok());
        CHECK(credential.value().getData() == data);
        reopened.value().reset();
        std::filesystem::remove_all(path);
    }

    TEST_CASE("Issuer is the submitting caller") {
        CredentialFixture f;
        // Alice submits a credential claiming the manufacturer's DID
        REQUIRE(f.registry.storeCredential(f.alice, "cred-1", "did:maker:e", "did:alice:w", "claim").is_ok());

        auto credential = f.registry.getCredential("cred-1").value();
        CHECK(credential.issuer == f.alice);
        CHECK(credential.issuer != f.maker);
    }

    TEST_CASE("Credentials are write-once") {
        CredentialFixture f;
        REQUIRE(f.registry.storeCredential(f.maker, "cred-1", "did:maker:e", "did:alice:e", "first").is_ok());

        auto second = f.registry.storeCredential(f.maker, "cred-1", "did:maker:e", "did:alice:e", "second");
        REQUIRE(second.is_err());
        CHECK(errorKind(second.error()) == ErrorKind::Conflict);
        CHECK(second.error().code == ERR_DUPLICATE_CREDENTIAL);
        CHECK(f.registry.getCredential("cred-1").value().getData() == "first");
    }

    TEST_CASE("Issuer and subject must be valid DIDs") {
        CredentialFixture f;

        SUBCASE("Unregistered issuer") {
            auto result = f.registry.storeCredential(f.maker, "cred-1", "did:ghost", "did:alice:e", "x");
            REQUIRE(result.is_err());
            CHECK(errorKind(result.error()) == ErrorKind::Validation);
            CHECK(result.error().code == ERR_INVALID_DID);
        }

        SUBCASE("Unregistered subject") {
            auto result = f.registry.storeCredential(f.maker, "cred-1", "did:maker:e", "did:ghost", "x");
            REQUIRE(result.is_err());
            CHECK(errorKind(result.error()) == ErrorKind::Validation);
        }

        SUBCASE("Revoked subject") {
            REQUIRE(f.registry.storeDIDDocument(f.alice, "did:alice:e", "doc").is_ok());
            REQUIRE(f.registry.revokeDIDDocument(f.alice, "did:alice:e").is_ok());
            auto result = f.registry.storeCredential(f.maker, "cred-1", "did:maker:e", "did:alice:e", "x");
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_INVALID_DID);
        }

        CHECK(f.registry.getCredential("cred-1").is_err());
    }

    TEST_CASE("Vehicle and document DIDs are valid subjects") {
        CredentialFixture f;
        REQUIRE(f.registry
                    .registerVehicle(f.maker, "VIN001", "did:alice:e", "did:car:e", 2024, "Maker", "One", "did:car:w")
                    .is_ok());
        REQUIRE(f.registry.storeDIDDocument(f.alice, "did:doc:1", "doc").is_ok());

        CHECK(f.registry.storeCredential(f.maker, "cred-car", "did:maker:e", "did:car:e", "birth").is_ok());
        CHECK(f.registry.storeCredential(f.maker, "cred-doc", "did:maker:e", "did:doc:1", "attest").is_ok());
    }

    TEST_CASE("Empty id or data") {
        CredentialFixture f;
        CHECK(errorKind(f.registry.storeCredential(f.maker, "", "did:maker:e", "did:alice:e", "x").error()) ==
              ErrorKind::Validation);
        CHECK(errorKind(f.registry.storeCredential(f.maker, "cred-1", "did:maker:e", "did:alice:e", "").error()) ==
              ErrorKind::Validation);
    }

    TEST_CASE("Missing credential") {
        Registry registry;
        auto result = registry.getCredential("nope");
        REQUIRE(result.is_err());
        CHECK(errorKind(result.error()) == ErrorKind::NotFound);
        CHECK(result.error().code == ERR_CREDENTIAL_NOT_FOUND);
    }
}
