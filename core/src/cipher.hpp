#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <openssl/evp.h>

// Uniform encrypt/decrypt over OpenSSL EVP symmetric ciphers.
// Every call builds and frees its own EVP_CIPHER_CTX; nothing is shared.

namespace cipher {

enum class Mode { CBC, GCM, CCM, OCB, ChaCha20Poly1305 };

// One entry of the supported-algorithm table.
struct Suite {
    const char*        name;            // canonical lowercase name, e.g. "aes-256-gcm"
    const EVP_CIPHER* (*evp)();
    Mode               mode;
    bool               produces_tag;
    int                iv_min;          // IV lengths the cipher accepts, in bytes
    int                iv_max;
};

static constexpr int kTagLen = 16;

// Exact, case-insensitive lookup. Throws sealcookie::Error(InvalidConfig) for
// names not in the table.
const Suite& find_suite(const std::string& algorithm);

// InvalidConfig unless the key is exactly the cipher's key length and the IV
// length lies within [iv_min, iv_max]. Runs before any IV is generated.
void check_lengths(const Suite& suite, size_t key_len, size_t iv_len);

// Cryptographically random bytes from RAND_bytes.
std::vector<uint8_t> random_iv(int len);

struct Sealed {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> auth_tag;      // kTagLen bytes, or empty when !produces_tag
};

// The tag is read from the context only after EVP_EncryptFinal_ex.
Sealed encrypt(const Suite& suite,
               const std::vector<uint8_t>& key,
               const std::vector<uint8_t>& iv,
               const std::string& plaintext);

// Installs auth_tag before finalizing. Throws AuthenticationFailure on a tag
// mismatch, CorruptPayload when a non-AEAD suite fails to finalize (bad padding).
std::string decrypt(const Suite& suite,
                    const std::vector<uint8_t>& key,
                    const std::vector<uint8_t>& iv,
                    const std::vector<uint8_t>& auth_tag,
                    const std::vector<uint8_t>& ciphertext);

} // namespace cipher
