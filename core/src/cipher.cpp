#include "cipher.hpp"
#include "sealcookie.hpp"
#include <openssl/rand.h>
#include <cctype>
#include <stdexcept>

using sealcookie::Error;
using sealcookie::ErrorKind;

namespace cipher {

// ── Suite table ───────────────────────────────────────────────────────────────

// AEAD modes plus CBC. Unauthenticated stream modes (CTR, OFB, CFB) are not offered.
static const Suite kSuites[] = {
    { "aes-128-cbc",       EVP_aes_128_cbc,       Mode::CBC,              false, 16,  16 },
    { "aes-192-cbc",       EVP_aes_192_cbc,       Mode::CBC,              false, 16,  16 },
    { "aes-256-cbc",       EVP_aes_256_cbc,       Mode::CBC,              false, 16,  16 },
    { "aes-128-gcm",       EVP_aes_128_gcm,       Mode::GCM,              true,   1, 128 },
    { "aes-192-gcm",       EVP_aes_192_gcm,       Mode::GCM,              true,   1, 128 },
    { "aes-256-gcm",       EVP_aes_256_gcm,       Mode::GCM,              true,   1, 128 },
    { "aes-128-ccm",       EVP_aes_128_ccm,       Mode::CCM,              true,   7,  13 },
    { "aes-192-ccm",       EVP_aes_192_ccm,       Mode::CCM,              true,   7,  13 },
    { "aes-256-ccm",       EVP_aes_256_ccm,       Mode::CCM,              true,   7,  13 },
    { "aes-128-ocb",       EVP_aes_128_ocb,       Mode::OCB,              true,   1,  15 },
    { "aes-192-ocb",       EVP_aes_192_ocb,       Mode::OCB,              true,   1,  15 },
    { "aes-256-ocb",       EVP_aes_256_ocb,       Mode::OCB,              true,   1,  15 },
    { "chacha20-poly1305", EVP_chacha20_poly1305, Mode::ChaCha20Poly1305, true,   1,  12 },
};

const Suite& find_suite(const std::string& algorithm) {
    std::string lower;
    lower.reserve(algorithm.size());
    for (unsigned char c : algorithm)
        lower += (char)std::tolower(c);

    for (const auto& s : kSuites) {
        if (lower == s.name)
            return s;
    }
    throw Error(ErrorKind::InvalidConfig, "unsupported algorithm '" + algorithm + "'");
}

std::vector<uint8_t> random_iv(int len) {
    std::vector<uint8_t> iv((size_t)len);
    if (RAND_bytes(iv.data(), len) != 1)
        throw Error(ErrorKind::EncryptionFailure, "RAND_bytes failed");
    return iv;
}

// ── helpers ───────────────────────────────────────────────────────────────────

static const EVP_CIPHER* resolve(const Suite& suite) {
    const EVP_CIPHER* c = suite.evp();
    if (!c)
        throw Error(ErrorKind::EncryptionFailure,
                    std::string(suite.name) + ": not available in this OpenSSL build");
    return c;
}

void check_lengths(const Suite& suite, size_t key_len, size_t iv_len) {
    size_t want = (size_t)EVP_CIPHER_key_length(resolve(suite));
    if (key_len != want)
        throw Error(ErrorKind::InvalidConfig,
                    std::string(suite.name) + ": secret must be " + std::to_string(want) +
                    " bytes, got " + std::to_string(key_len));

    if (iv_len < (size_t)suite.iv_min || iv_len > (size_t)suite.iv_max) {
        std::string range = suite.iv_min == suite.iv_max
            ? std::to_string(suite.iv_min)
            : std::to_string(suite.iv_min) + ".." + std::to_string(suite.iv_max);
        throw Error(ErrorKind::InvalidConfig,
                    std::string(suite.name) + ": iv length must be " + range +
                    " bytes, got " + std::to_string(iv_len));
    }
}

// ── encrypt ───────────────────────────────────────────────────────────────────

Sealed encrypt(const Suite& suite,
               const std::vector<uint8_t>& key,
               const std::vector<uint8_t>& iv,
               const std::string& plaintext)
{
    const EVP_CIPHER* c = resolve(suite);
    check_lengths(suite, key.size(), iv.size());
    const std::string name = suite.name;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw Error(ErrorKind::EncryptionFailure, "EVP_CIPHER_CTX_new failed");

    auto cleanup = [&]{ EVP_CIPHER_CTX_free(ctx); };

    if (EVP_EncryptInit_ex(ctx, c, nullptr, nullptr, nullptr) != 1) {
        cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": EVP_EncryptInit_ex (cipher) failed");
    }
    if (suite.produces_tag) {
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, (int)iv.size(), nullptr) != 1) {
            cleanup();
            throw Error(ErrorKind::InvalidConfig,
                        name + ": iv length " + std::to_string(iv.size()) + " not supported");
        }
    }
    if (suite.mode == Mode::CCM) {
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, kTagLen, nullptr) != 1) {
            cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": EVP_CTRL_AEAD_SET_TAG (length) failed");
        }
    }
    if (EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), iv.data()) != 1) {
        cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": EVP_EncryptInit_ex (key/iv) failed");
    }

    // CCM needs the total message length up front
    int len = 0;
    if (suite.mode == Mode::CCM) {
        if (EVP_EncryptUpdate(ctx, nullptr, &len, nullptr, (int)plaintext.size()) != 1) {
            cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": CCM length setup failed");
        }
    }

    Sealed out;
    out.ciphertext.resize(plaintext.size() + (size_t)EVP_CIPHER_block_size(c));
    len = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx, out.ciphertext.data(), &len,
                              reinterpret_cast<const uint8_t*>(plaintext.data()),
                              (int)plaintext.size()) != 1) {
            cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": EVP_EncryptUpdate failed");
        }
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx, out.ciphertext.data() + len, &final_len) != 1) {
        cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": EVP_EncryptFinal_ex failed");
    }
    out.ciphertext.resize((size_t)(len + final_len));

    // Must follow EncryptFinal: before it the tag is incomplete
    if (suite.produces_tag) {
        out.auth_tag.resize(kTagLen);
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, kTagLen, out.auth_tag.data()) != 1) {
            cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": EVP_CTRL_AEAD_GET_TAG failed");
        }
    }
    cleanup();
    return out;
}

// ── decrypt ───────────────────────────────────────────────────────────────────

std::string decrypt(const Suite& suite,
                    const std::vector<uint8_t>& key,
                    const std::vector<uint8_t>& iv,
                    const std::vector<uint8_t>& auth_tag,
                    const std::vector<uint8_t>& ciphertext)
{
    const EVP_CIPHER* c = resolve(suite);
    check_lengths(suite, key.size(), iv.size());
    const std::string name = suite.name;

    // Short tags would weaken verification; only the full tag is accepted
    if (suite.produces_tag && auth_tag.size() != (size_t)kTagLen)
        throw Error(ErrorKind::AuthenticationFailure,
                    name + ": auth tag must be " + std::to_string(kTagLen) +
                    " bytes, got " + std::to_string(auth_tag.size()));

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw Error(ErrorKind::EncryptionFailure, "EVP_CIPHER_CTX_new failed");

    auto cleanup = [&]{ EVP_CIPHER_CTX_free(ctx); };

    if (EVP_DecryptInit_ex(ctx, c, nullptr, nullptr, nullptr) != 1) {
        cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": EVP_DecryptInit_ex (cipher) failed");
    }
    if (suite.produces_tag) {
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, (int)iv.size(), nullptr) != 1) {
            cleanup();
            throw Error(ErrorKind::InvalidConfig,
                        name + ": iv length " + std::to_string(iv.size()) + " not supported");
        }
    }
    // CCM takes the expected tag before the key
    if (suite.mode == Mode::CCM) {
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, kTagLen,
                                const_cast<uint8_t*>(auth_tag.data())) != 1) {
            cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": EVP_CTRL_AEAD_SET_TAG failed");
        }
    }
    if (EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), iv.data()) != 1) {
        cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": EVP_DecryptInit_ex (key/iv) failed");
    }

    std::string plaintext(ciphertext.size() + (size_t)EVP_CIPHER_block_size(c), '\0');
    uint8_t* pt = reinterpret_cast<uint8_t*>(&plaintext[0]);
    int len = 0;

    if (suite.mode == Mode::CCM) {
        // CCM verifies the tag inside the single DecryptUpdate call; no Final step
        if (EVP_DecryptUpdate(ctx, nullptr, &len, nullptr, (int)ciphertext.size()) != 1) {
            cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": CCM length setup failed");
        }
        len = 0;
        int rc = EVP_DecryptUpdate(ctx, pt, &len, ciphertext.data(), (int)ciphertext.size());
        cleanup();
        if (rc != 1)
            throw Error(ErrorKind::AuthenticationFailure, name + ": authentication failed");
        plaintext.resize((size_t)len);
        return plaintext;
    }

    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx, pt, &len, ciphertext.data(), (int)ciphertext.size()) != 1) {
            cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": EVP_DecryptUpdate failed");
        }
    }

    // Expected tag goes in before finalising
    if (suite.produces_tag) {
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, kTagLen,
                                const_cast<uint8_t*>(auth_tag.data())) != 1) {
            cleanup(); throw Error(ErrorKind::EncryptionFailure, name + ": EVP_CTRL_AEAD_SET_TAG failed");
        }
    }

    int final_len = 0;
    int rc = EVP_DecryptFinal_ex(ctx, pt + len, &final_len);
    cleanup();

    if (rc != 1) {
        if (suite.produces_tag)
            throw Error(ErrorKind::AuthenticationFailure, name + ": authentication failed");
        throw Error(ErrorKind::CorruptPayload, name + ": decryption failed (bad padding)");
    }

    plaintext.resize((size_t)(len + final_len));
    return plaintext;
}

} // namespace cipher
