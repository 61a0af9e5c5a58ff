#pragma once
#include <string>
#include <stdexcept>
#include "KeyStore.hpp"

// Token layout: base64(nonce[12] || ciphertext || tag[16]), standard alphabet, padded.
// AES-256-GCM, no associated data.

enum class DecryptErrorKind {
    MalformedEncoding,   // not valid base64
    TooShort,            // fewer bytes than nonce + tag
    AuthenticationFailed, // corrupted, truncated, or sealed under another key
    InvalidUtf8          // authenticated but not text
};

struct DecryptionError {
    DecryptErrorKind kind;
    std::string message;
};

const char* toString(DecryptErrorKind kind);

// Outcome of decrypting one field. Either plaintext or error is meaningful, never both.
class DecryptResult {
public:
    static DecryptResult success(std::string plaintext);
    static DecryptResult failure(DecryptErrorKind kind, std::string message);

    bool ok() const { return succeeded; }
    explicit operator bool() const { return succeeded; }

    // Only valid when ok()
    const std::string& value() const;
    // Only valid when !ok()
    const DecryptionError& error() const;

    // Plaintext, or the fallback text when decryption failed
    std::string valueOr(const std::string& fallback) const;

private:
    bool succeeded = false;
    std::string plaintext;
    DecryptionError err{DecryptErrorKind::MalformedEncoding, ""};
};

// Thrown by FieldCipher::decryptOrThrow for callers that prefer to propagate.
class DecryptionFailed : public std::runtime_error {
public:
    explicit DecryptionFailed(const DecryptionError& e)
        : std::runtime_error(e.message), error(e) {}

    DecryptionError error;
};

class FieldCipher {
public:
    static constexpr std::size_t NONCE_BYTES = 12;
    static constexpr std::size_t TAG_BYTES = 16;

    // Throws std::runtime_error if libsodium can't start or the CPU lacks AES-GCM support.
    explicit FieldCipher(const SecretKey& key);

    // Fresh random nonce on every call, so equal plaintexts give different tokens.
    std::string encrypt(const std::string& plaintext) const;

    // Never throws for bad tokens; inspect the result instead.
    DecryptResult decrypt(const std::string& token) const;

    std::string decryptOrThrow(const std::string& token) const;

private:
    const SecretKey key;
};

bool isValidUtf8(const std::string& s);
