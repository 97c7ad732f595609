#include "cipher.hpp"
#include "sealcookie.hpp"
#include <iostream>
#include <string>

using sealcookie::ErrorKind;

static bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

template <typename Fn>
static bool expect_error(ErrorKind kind, Fn fn, const std::string& msg) {
    try {
        fn();
    } catch (const sealcookie::Error& e) {
        if (e.kind() == kind) return true;
        return fail(msg + ": got " + sealcookie::kind_name(e.kind()) + " (" + e.what() + ")");
    }
    return fail(msg + ": no error thrown");
}

template <typename Fn>
static bool expect_ok(Fn fn, const std::string& msg) {
    try {
        fn();
    } catch (const std::exception& e) {
        return fail(msg + ": unexpected error: " + e.what());
    }
    return true;
}

static std::vector<uint8_t> key_of(size_t len) {
    std::vector<uint8_t> k(len);
    for (size_t i = 0; i < len; ++i) k[i] = (uint8_t)(0x40 + i);
    return k;
}

// Encrypt then decrypt one message under a suite.
static bool round_trip(const std::string& alg, size_t key_len, int iv_len) {
    const std::string msg = "{\"user\": \"alice\", \"roles\": [\"admin\", \"dev\"], \"n\": 7}";
    try {
        const cipher::Suite& s = cipher::find_suite(alg);
        std::vector<uint8_t> key = key_of(key_len);
        std::vector<uint8_t> iv  = cipher::random_iv(iv_len);

        cipher::Sealed sealed = cipher::encrypt(s, key, iv, msg);
        bool ok = true;
        ok &= check(!sealed.ciphertext.empty(), alg + ": ciphertext produced");
        ok &= check(sealed.auth_tag.size() == (s.produces_tag ? (size_t)cipher::kTagLen : 0u),
                    alg + ": tag length");

        std::string plain = cipher::decrypt(s, key, iv, sealed.auth_tag, sealed.ciphertext);
        ok &= check(plain == msg, alg + ": plaintext round trip");
        return ok;
    } catch (const std::exception& e) {
        return fail(alg + ": unexpected error: " + e.what());
    }
}

int main() {
    bool ok = true;

    // Suite lookup
    ok &= check(cipher::find_suite("aes-256-gcm").produces_tag,        "gcm produces tag");
    ok &= check(cipher::find_suite("AES-256-GCM").mode == cipher::Mode::GCM, "lookup is case-insensitive");
    ok &= check(cipher::find_suite("aes-128-ccm").produces_tag,        "ccm produces tag");
    ok &= check(cipher::find_suite("aes-192-ocb").produces_tag,        "ocb produces tag");
    ok &= check(cipher::find_suite("chacha20-poly1305").produces_tag,  "chacha20-poly1305 produces tag");
    ok &= check(!cipher::find_suite("aes-256-cbc").produces_tag,       "cbc has no tag");

    // Names that merely contain a mode string are not suites
    ok &= expect_error(ErrorKind::InvalidConfig, []{ cipher::find_suite("aes-256-cbc-gcm"); }, "substring trap");
    ok &= expect_error(ErrorKind::InvalidConfig, []{ cipher::find_suite("gcm"); },             "bare mode name");
    ok &= expect_error(ErrorKind::InvalidConfig, []{ cipher::find_suite("rot13"); },           "unknown algorithm");

    // Unauthenticated stream modes are not offered
    ok &= expect_error(ErrorKind::InvalidConfig, []{ cipher::find_suite("aes-256-ctr"); },     "ctr not offered");
    ok &= expect_error(ErrorKind::InvalidConfig, []{ cipher::find_suite("aes-128-ofb"); },     "ofb not offered");

    // IV generation
    std::vector<uint8_t> a = cipher::random_iv(12);
    std::vector<uint8_t> b = cipher::random_iv(12);
    ok &= check(a.size() == 12 && b.size() == 12, "random_iv length");
    ok &= check(a != b, "random_iv differs between calls");

    // Every suite round-trips
    ok &= round_trip("aes-128-gcm", 16, 12);
    ok &= round_trip("aes-192-gcm", 24, 12);
    ok &= round_trip("aes-256-gcm", 32, 12);
    ok &= round_trip("aes-256-gcm", 32, 16);
    ok &= round_trip("aes-128-ccm", 16, 12);
    ok &= round_trip("aes-256-ccm", 32, 7);
    ok &= round_trip("aes-128-ocb", 16, 12);
    ok &= round_trip("aes-256-ocb", 32, 12);
    ok &= round_trip("chacha20-poly1305", 32, 12);
    ok &= round_trip("aes-128-cbc", 16, 16);
    ok &= round_trip("aes-256-cbc", 32, 16);
    ok &= round_trip("aes-192-cbc", 24, 16);
    ok &= round_trip("aes-128-ocb", 16, 15);
    ok &= round_trip("aes-128-ccm", 16, 13);

    // Configuration errors
    const cipher::Suite& gcm = cipher::find_suite("aes-256-gcm");
    const cipher::Suite& cbc = cipher::find_suite("aes-256-cbc");
    const cipher::Suite& ccm = cipher::find_suite("aes-256-ccm");

    ok &= expect_error(ErrorKind::InvalidConfig,
                       [&]{ cipher::encrypt(gcm, key_of(16), cipher::random_iv(12), "{}"); },
                       "short key for aes-256-gcm");
    ok &= expect_error(ErrorKind::InvalidConfig,
                       [&]{ cipher::encrypt(cbc, key_of(32), cipher::random_iv(12), "{}"); },
                       "cbc requires 16-byte iv");
    ok &= expect_error(ErrorKind::InvalidConfig,
                       [&]{ cipher::encrypt(ccm, key_of(32), cipher::random_iv(16), "{}"); },
                       "ccm rejects 16-byte iv");

    // Length checks use the table bounds, without touching OpenSSL state
    ok &= expect_error(ErrorKind::InvalidConfig, [&]{ cipher::check_lengths(gcm, 32, 0); },    "gcm zero iv");
    ok &= expect_error(ErrorKind::InvalidConfig, [&]{ cipher::check_lengths(gcm, 32, 129); },  "gcm iv over 128");
    ok &= expect_error(ErrorKind::InvalidConfig, [&]{ cipher::check_lengths(ccm, 32, 6); },    "ccm iv under 7");
    ok &= expect_error(ErrorKind::InvalidConfig,
                       [&]{ cipher::check_lengths(cipher::find_suite("chacha20-poly1305"), 32, 13); },
                       "chacha20-poly1305 iv over 12");
    ok &= expect_error(ErrorKind::InvalidConfig, [&]{ cipher::check_lengths(cbc, 32, 1u << 30); },
                       "huge iv length");
    ok &= expect_error(ErrorKind::InvalidConfig, [&]{ cipher::check_lengths(cbc, 31, 16); },   "cbc short key");
    ok &= expect_ok([&]{ cipher::check_lengths(gcm, 32, 128); }, "gcm iv of 128");
    ok &= expect_ok([&]{ cipher::check_lengths(ccm, 32, 7); },   "ccm iv of 7");

    // Tag verification
    std::vector<uint8_t> key = key_of(32);
    std::vector<uint8_t> iv  = cipher::random_iv(12);
    cipher::Sealed sealed = cipher::encrypt(gcm, key, iv, "{\"user\": \"alice\"}");

    {
        std::vector<uint8_t> bad_tag = sealed.auth_tag;
        bad_tag[0] ^= 0x01;
        ok &= expect_error(ErrorKind::AuthenticationFailure,
                           [&]{ cipher::decrypt(gcm, key, iv, bad_tag, sealed.ciphertext); },
                           "gcm flipped tag");
    }
    {
        std::vector<uint8_t> bad_ct = sealed.ciphertext;
        bad_ct.back() ^= 0x80;
        ok &= expect_error(ErrorKind::AuthenticationFailure,
                           [&]{ cipher::decrypt(gcm, key, iv, sealed.auth_tag, bad_ct); },
                           "gcm flipped ciphertext");
    }
    {
        std::vector<uint8_t> short_tag(sealed.auth_tag.begin(), sealed.auth_tag.begin() + 8);
        ok &= expect_error(ErrorKind::AuthenticationFailure,
                           [&]{ cipher::decrypt(gcm, key, iv, short_tag, sealed.ciphertext); },
                           "gcm truncated tag");
    }
    {
        std::vector<uint8_t> ccm_iv = cipher::random_iv(12);
        cipher::Sealed cs = cipher::encrypt(ccm, key, ccm_iv, "{\"user\": \"alice\"}");
        cs.ciphertext[0] ^= 0x01;
        ok &= expect_error(ErrorKind::AuthenticationFailure,
                           [&]{ cipher::decrypt(ccm, key, ccm_iv, cs.auth_tag, cs.ciphertext); },
                           "ccm flipped ciphertext");
    }
    {
        std::vector<uint8_t> wrong_key = key;
        wrong_key[5] ^= 0xff;
        ok &= expect_error(ErrorKind::AuthenticationFailure,
                           [&]{ cipher::decrypt(gcm, wrong_key, iv, sealed.auth_tag, sealed.ciphertext); },
                           "gcm wrong key");
    }

    // Non-AEAD: padding damage surfaces as CorruptPayload
    {
        std::vector<uint8_t> cbc_iv = cipher::random_iv(16);
        cipher::Sealed cs = cipher::encrypt(cbc, key, cbc_iv,
                                            "{\"user\": \"alice\", \"theme\": \"dark\"}");
        ok &= check(cs.ciphertext.size() >= 32, "cbc message spans two blocks");
        // Last byte of the penultimate block XORs straight into the padding byte
        cs.ciphertext[cs.ciphertext.size() - 17] ^= 0x01;
        ok &= expect_error(ErrorKind::CorruptPayload,
                           [&]{ cipher::decrypt(cbc, key, cbc_iv, {}, cs.ciphertext); },
                           "cbc broken padding");
    }

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
