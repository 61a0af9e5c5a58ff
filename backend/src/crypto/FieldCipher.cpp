#include "FieldCipher.hpp"
#include <vector>
#include <sodium.h>
#include <spdlog/spdlog.h>

static_assert(FieldCipher::NONCE_BYTES == crypto_aead_aes256gcm_NPUBBYTES, "GCM nonce size");
static_assert(FieldCipher::TAG_BYTES == crypto_aead_aes256gcm_ABYTES, "GCM tag size");
static_assert(SecretKey::SIZE == crypto_aead_aes256gcm_KEYBYTES, "GCM key size");

const char* toString(DecryptErrorKind kind) {
    switch (kind) {
    case DecryptErrorKind::MalformedEncoding: return "malformed encoding";
    case DecryptErrorKind::TooShort: return "token too short";
    case DecryptErrorKind::AuthenticationFailed: return "authentication failed";
    case DecryptErrorKind::InvalidUtf8: return "invalid UTF-8";
    }
    return "unknown";
}

DecryptResult DecryptResult::success(std::string plaintext) {
    DecryptResult r;
    r.succeeded = true;
    r.plaintext = std::move(plaintext);
    return r;
}

DecryptResult DecryptResult::failure(DecryptErrorKind kind, std::string message) {
    DecryptResult r;
    r.succeeded = false;
    r.err = DecryptionError{kind, std::move(message)};
    return r;
}

const std::string& DecryptResult::value() const {
    if (!succeeded) throw std::logic_error("DecryptResult::value() on failed result");
    return plaintext;
}

const DecryptionError& DecryptResult::error() const {
    if (succeeded) throw std::logic_error("DecryptResult::error() on successful result");
    return err;
}

std::string DecryptResult::valueOr(const std::string& fallback) const {
    return succeeded ? plaintext : fallback;
}

// Rejects overlongs, surrogates and code points past U+10FFFF.
bool isValidUtf8(const std::string& s) {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    std::size_t n = s.size();
    std::size_t i = 0;

    while (i < n) {
        unsigned char c = p[i];
        if (c < 0x80) { ++i; continue; }

        std::size_t len;
        unsigned int cp;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            if ((p[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (p[i + k] & 0x3F);
        }

        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;

        i += len;
    }
    return true;
}

static std::string toBase64(const std::vector<unsigned char>& bin) {
    const int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_ENCODED_LEN(bin.size(), variant), '\0');
    sodium_bin2base64(&out[0], out.size(), bin.data(), bin.size(), variant);
    out.resize(out.size() - 1); // drop the terminating NUL
    return out;
}

static bool fromBase64(const std::string& text, std::vector<unsigned char>& out) {
    // Decoded length never exceeds 3/4 of the input
    out.resize(text.size() / 4 * 3 + 3);
    std::size_t bin_len = 0;

    // b64_end == nullptr: trailing garbage makes the call fail
    if (sodium_base642bin(out.data(), out.size(),
        text.c_str(), text.size(),
        nullptr, &bin_len, nullptr,
        sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        out.clear();
        return false;
    }

    out.resize(bin_len);
    return true;
}

FieldCipher::FieldCipher(const SecretKey& k)
    : key(k)
{
    if (sodium_init() < 0) {
        spdlog::error("libsodium initialisation failed");
        throw std::runtime_error("libsodium initialisation failed");
    }

    if (crypto_aead_aes256gcm_is_available() == 0) {
        spdlog::error("AES-256-GCM is not supported on this CPU");
        throw std::runtime_error("AES-256-GCM is not supported on this CPU");
    }

    spdlog::debug("FieldCipher ready (AES-256-GCM)");
}

std::string FieldCipher::encrypt(const std::string& plaintext) const {
    std::vector<unsigned char> blob(NONCE_BYTES + plaintext.size() + TAG_BYTES);

    unsigned char* nonce = blob.data();
    randombytes_buf(nonce, NONCE_BYTES);

    unsigned long long clen = 0;
    if (crypto_aead_aes256gcm_encrypt(
        blob.data() + NONCE_BYTES, &clen,
        reinterpret_cast<const unsigned char*>(plaintext.data()),
        static_cast<unsigned long long>(plaintext.size()),
        nullptr, 0,
        nullptr, nonce, key.data()) != 0)
    {
        spdlog::error("crypto_aead_aes256gcm_encrypt failed ({} byte field)", plaintext.size());
        throw std::runtime_error("field encryption failed");
    }

    blob.resize(NONCE_BYTES + clen);
    return toBase64(blob);
}

DecryptResult FieldCipher::decrypt(const std::string& token) const {
    std::vector<unsigned char> blob;
    if (!fromBase64(token, blob)) {
        spdlog::warn("Token rejected: not valid base64 ({} chars)", token.size());
        return DecryptResult::failure(DecryptErrorKind::MalformedEncoding, "token is not valid base64");
    }

    if (blob.size() < NONCE_BYTES + TAG_BYTES) {
        spdlog::warn("Token rejected: {} bytes is shorter than nonce + tag", blob.size());
        return DecryptResult::failure(DecryptErrorKind::TooShort, "token is too short");
    }

    const unsigned char* nonce = blob.data();
    const unsigned char* ct = blob.data() + NONCE_BYTES;
    std::size_t ct_len = blob.size() - NONCE_BYTES;

    std::string plain(ct_len - TAG_BYTES, '\0');
    unsigned long long plen = 0;

    if (crypto_aead_aes256gcm_decrypt(
        reinterpret_cast<unsigned char*>(&plain[0]), &plen,
        nullptr,
        ct, static_cast<unsigned long long>(ct_len),
        nullptr, 0,
        nonce, key.data()) != 0)
    {
        spdlog::warn("Token rejected: authentication failed");
        return DecryptResult::failure(DecryptErrorKind::AuthenticationFailed,
            "authentication failed (corrupted token or different key)");
    }
    plain.resize(plen);

    if (!isValidUtf8(plain)) {
        sodium_memzero(&plain[0], plain.size());
        spdlog::warn("Token rejected: plaintext is not valid UTF-8");
        return DecryptResult::failure(DecryptErrorKind::InvalidUtf8, "decrypted field is not valid UTF-8");
    }

    return DecryptResult::success(std::move(plain));
}

std::string FieldCipher::decryptOrThrow(const std::string& token) const {
    DecryptResult r = decrypt(token);
    if (!r) throw DecryptionFailed(r.error());
    return r.value();
}
