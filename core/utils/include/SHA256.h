#pragma once

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace BehaviorSentinel {

    /**
     * @brief SHA-256 digests through the OpenSSL EVP interface
     */
    class SHA256 {
    public:
        /**
         * @brief Hex digest of the input, truncated to the first prefixBytes bytes
         * @return std::nullopt when OpenSSL fails
         */
        static std::optional<std::string> hexDigest(const std::string& input,
                                                    size_t prefixBytes = SHA256_DIGEST_LENGTH) {
            std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
            if (!ctx) return std::nullopt;

            unsigned char digest[SHA256_DIGEST_LENGTH];
            unsigned int digestLen = 0;
            if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
                EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
                EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
                return std::nullopt;
            }

            size_t count = prefixBytes < digestLen ? prefixBytes : digestLen;
            std::ostringstream ss;
            for (size_t i = 0; i < count; ++i) {
                ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(digest[i]);
            }
            return ss.str();
        }

    };

}
