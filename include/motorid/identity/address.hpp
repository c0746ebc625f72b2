#pragma once

#include <cctype>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace motorid {

    /// Participant address: an opaque, comparable key
    /// Addresses derived from a wallet key have the form 0x<40 hex chars>, the first
    /// 20 bytes of SHA-256 over the Ed25519 public key. Any non-empty string is accepted
    /// as an address so that externally issued account identifiers can be used as-is.
    class Address {
      public:
        static constexpr dp::usize DERIVED_BYTES = 20;

        Address() = default;

        inline explicit Address(const std::string &value) : value_(dp::String(value.c_str())) {}

        inline explicit Address(const char *value) : value_(dp::String(value)) {}

        /// Derive the address of an Ed25519 public key
        inline static dp::Result<Address, dp::Error> fromPublicKey(const std::vector<uint8_t> &public_key) {
            if (public_key.empty()) {
                return dp::Result<Address, dp::Error>::err(dp::Error::invalid_argument("Public key is empty"));
            }

            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            auto hash_result = crypto.hash(public_key);
            if (!hash_result.success || hash_result.data.size() < DERIVED_BYTES) {
                return dp::Result<Address, dp::Error>::err(dp::Error::io_error("Address hash failed"));
            }

            std::vector<uint8_t> truncated(hash_result.data.begin(), hash_result.data.begin() + DERIVED_BYTES);
            return dp::Result<Address, dp::Error>::ok(Address("0x" + keylock::keylock::to_hex(truncated)));
        }

        /// Null address (no owner, no insurer, no controller)
        inline static Address null() { return Address(); }

        inline bool isNull() const { return value_.empty(); }

        /// True for 0x-prefixed 40-hex-digit addresses
        inline bool isDerived() const {
            std::string s(value_.c_str());
            if (s.size() != 2 + DERIVED_BYTES * 2 || s.substr(0, 2) != "0x")
                return false;
            for (size_t i = 2; i < s.size(); ++i) {
                if (!std::isxdigit(static_cast<unsigned char>(s[i])))
                    return false;
            }
            return true;
        }

        inline std::string toString() const { return std::string(value_.c_str()); }

        inline bool operator==(const Address &other) const { return toString() == other.toString(); }

        inline bool operator!=(const Address &other) const { return !(*this == other); }

        inline bool operator<(const Address &other) const { return toString() < other.toString(); }

        inline size_t hash() const { return std::hash<std::string>{}(toString()); }

        /// Serialization
        auto members() { return std::tie(value_); }
        auto members() const { return std::tie(value_); }

      private:
        dp::String value_;
    };

} // namespace motorid

namespace std {
    template <> struct hash<motorid::Address> {
        size_t operator()(const motorid::Address &address) const { return address.hash(); }
    };
} // namespace std
