#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstddef>
#include <stdexcept>

// Raised when the key file exists but cannot be used, or a new key cannot be saved.
// Fatal: continuing would mean silently generating a fresh key and orphaning old data.
class KeyIOError : public std::runtime_error {
public:
    explicit KeyIOError(const std::string& msg) : std::runtime_error(msg) {}
};

// 256-bit symmetric key. Wiped from memory on destruction.
class SecretKey {
public:
    static constexpr std::size_t SIZE = 32;

    explicit SecretKey(std::vector<unsigned char> bytes);
    SecretKey(const SecretKey& other);
    SecretKey& operator=(const SecretKey& other);
    ~SecretKey();

    const unsigned char* data() const { return bytes.data(); }
    std::size_t size() const { return bytes.size(); }

    bool operator==(const SecretKey& other) const;
    bool operator!=(const SecretKey& other) const { return !(*this == other); }

    static SecretKey generate();

private:
    std::vector<unsigned char> bytes;
};

// Owns the single key file of a deployment.
//
// First run: a random key is generated, written with mode 0600 and fsync'd,
// then returned. Every later run reads the same bytes back. The file is never
// rewritten once it exists.
class KeyStore {
public:
    explicit KeyStore(const std::string& keyFile = "budget_key.key");

    // Throws KeyIOError. The result is cached for the lifetime of this object.
    const SecretKey& loadOrCreate();

    // True if loadOrCreate() had to generate a new key in this process.
    bool createdNewKey() const { return created; }

    const std::string& path() const { return keyPath; }

private:
    std::string keyPath;
    std::unique_ptr<SecretKey> cached;
    bool created = false;

    SecretKey readKey() const;
    void writeKey(const SecretKey& key) const;
};
