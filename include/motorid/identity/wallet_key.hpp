#pragma once

#include "address.hpp"
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <vector>

namespace motorid {

    /// Ed25519 wallet keypair of a participant
    /// A wallet key owns exactly one address (see Address::fromPublicKey)
    class WalletKey {
      public:
        /// Generate a new Ed25519 keypair
        inline static dp::Result<WalletKey, dp::Error> generate() {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto keypair = crypto.generate_keypair();

            if (keypair.private_key.empty()) {
                return dp::Result<WalletKey, dp::Error>::err(dp::Error::io_error("Failed to generate keypair"));
            }

            return dp::Result<WalletKey, dp::Error>::ok(WalletKey(keypair));
        }

        /// Verification-only key
        inline static dp::Result<WalletKey, dp::Error> fromPublicKey(const std::vector<uint8_t> &public_key) {
            if (public_key.size() != 32) {
                return dp::Result<WalletKey, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 public key must be 32 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.public_key = public_key;
            return dp::Result<WalletKey, dp::Error>::ok(WalletKey(keypair));
        }

        inline dp::Result<std::vector<uint8_t>, dp::Error> sign(const std::vector<uint8_t> &data) const {
            if (keypair_.private_key.empty()) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::io_error("No private key available"));
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.sign(data, keypair_.private_key);

            if (!result.success) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::io_error(dp::String(result.error_message.c_str())));
            }

            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
        }

        /// False for a bad signature as well as for a key without public half
        inline bool verify(const std::vector<uint8_t> &data, const std::vector<uint8_t> &signature) const {
            if (keypair_.public_key.empty())
                return false;

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            return crypto.verify(data, signature, keypair_.public_key).success;
        }

        inline const std::vector<uint8_t> &getPublicKey() const { return keypair_.public_key; }

        inline bool hasPrivateKey() const { return !keypair_.private_key.empty(); }

        /// Address owned by this key
        inline dp::Result<Address, dp::Error> address() const { return Address::fromPublicKey(keypair_.public_key); }

        inline bool operator==(const WalletKey &other) const {
            return keypair_.public_key == other.keypair_.public_key;
        }

        inline bool operator!=(const WalletKey &other) const { return !(*this == other); }

      private:
        inline explicit WalletKey(const keylock::KeyPair &keypair) : keypair_(keypair) {}

        keylock::KeyPair keypair_;
    };

} // namespace motorid
