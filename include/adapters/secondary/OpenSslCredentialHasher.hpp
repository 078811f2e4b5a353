#pragma once

#include "ports/output/ICredentialHasher.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace finger::adapters::secondary {

/**
 * @brief Ключи на OpenSSL
 *
 * - generateKey(): UUID v4 из криптографического ГСЧ (RAND_bytes)
 * - hash(): SHA-256 в hex
 * - equals(): сравнение SHA-256 обеих строк через CRYPTO_memcmp,
 *   поэтому время не зависит ни от содержимого, ни от длины
 */
class OpenSslCredentialHasher : public ports::output::ICredentialHasher {
public:
    std::string generateKey() override {
        std::array<unsigned char, 16> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed: not enough entropy");
        }

        // xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // variant

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << "-";
            }
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    std::string hash(const std::string& key) const override {
        auto digest = sha256(key);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (unsigned char byte : digest) {
            ss << std::setw(2) << static_cast<int>(byte);
        }
        return ss.str();
    }

    bool equals(const std::string& a, const std::string& b) const override {
        auto da = sha256(a);
        auto db = sha256(b);
        return CRYPTO_memcmp(da.data(), db.data(), da.size()) == 0;
    }

private:
    using Digest = std::array<unsigned char, 32>;

    static Digest sha256(const std::string& data) {
        Digest digest{};
        unsigned int length = 0;
        if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1 ||
            length != digest.size()) {
            throw std::runtime_error("EVP_Digest(SHA-256) failed");
        }
        return digest;
    }
};

} // namespace finger::adapters::secondary
