#include "KeyStore.hpp"
#include <fstream>
#include <iterator>
#include <filesystem>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sodium.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

SecretKey::SecretKey(std::vector<unsigned char> b)
    : bytes(std::move(b))
{
    if (bytes.size() != SIZE)
        throw std::invalid_argument("secret key must be 32 bytes");
}

SecretKey::SecretKey(const SecretKey& other) : bytes(other.bytes) {}

SecretKey& SecretKey::operator=(const SecretKey& other) {
    if (this != &other) {
        sodium_memzero(bytes.data(), bytes.size());
        bytes = other.bytes;
    }
    return *this;
}

SecretKey::~SecretKey() {
    if (!bytes.empty())
        sodium_memzero(bytes.data(), bytes.size());
}

bool SecretKey::operator==(const SecretKey& other) const {
    return bytes.size() == other.bytes.size() &&
        sodium_memcmp(bytes.data(), other.bytes.data(), bytes.size()) == 0;
}

SecretKey SecretKey::generate() {
    if (sodium_init() < 0)
        throw std::runtime_error("libsodium initialisation failed");

    std::vector<unsigned char> b(SIZE);
    randombytes_buf(b.data(), b.size());
    return SecretKey(std::move(b));
}

KeyStore::KeyStore(const std::string& keyFile)
    : keyPath(keyFile)
{
    spdlog::debug("KeyStore using key file '{}'", keyPath);
}

const SecretKey& KeyStore::loadOrCreate() {
    if (cached) return *cached;

    std::error_code ec;
    bool present = fs::exists(keyPath, ec);
    if (ec) {
        spdlog::error("Cannot stat key file '{}': {}", keyPath, ec.message());
        throw KeyIOError("cannot access key file '" + keyPath + "': " + ec.message());
    }

    if (present) {
        cached = std::make_unique<SecretKey>(readKey());
        spdlog::info("Loaded encryption key from '{}'", keyPath);
        return *cached;
    }

    SecretKey fresh = SecretKey::generate();
    writeKey(fresh);
    cached = std::make_unique<SecretKey>(fresh);
    created = true;

    spdlog::warn("New encryption key generated and saved to '{}'; data encrypted under any previous key cannot be read", keyPath);
    return *cached;
}

SecretKey KeyStore::readKey() const {
    std::ifstream in(keyPath, std::ios::binary);
    if (!in) {
        spdlog::error("Key file '{}' exists but cannot be opened", keyPath);
        throw KeyIOError("cannot read key file '" + keyPath + "'");
    }

    std::vector<unsigned char> raw(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (in.bad()) {
        spdlog::error("I/O error while reading key file '{}'", keyPath);
        throw KeyIOError("I/O error reading key file '" + keyPath + "'");
    }

    if (raw.size() != SecretKey::SIZE) {
        spdlog::error("Key file '{}' has {} bytes, expected {}", keyPath, raw.size(), SecretKey::SIZE);
        sodium_memzero(raw.data(), raw.size());
        throw KeyIOError("key file '" + keyPath + "' is corrupt (wrong length)");
    }

    return SecretKey(std::move(raw));
}

void KeyStore::writeKey(const SecretKey& key) const {
    // O_EXCL: never overwrite a key that appeared since the existence check
    int fd = ::open(keyPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        int err = errno;
        spdlog::error("Cannot create key file '{}': {}", keyPath, std::strerror(err));
        throw KeyIOError("cannot create key file '" + keyPath + "': " + std::strerror(err));
    }

    const unsigned char* p = key.data();
    std::size_t left = key.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }

    bool ok = left == 0 && ::fsync(fd) == 0;
    int err = errno;
    if (::close(fd) != 0) ok = false;

    if (!ok) {
        ::unlink(keyPath.c_str());
        spdlog::error("Failed to persist key file '{}': {}", keyPath, std::strerror(err));
        throw KeyIOError("cannot write key file '" + keyPath + "': " + std::strerror(err));
    }

    spdlog::debug("Key file '{}' written ({} bytes)", keyPath, key.size());
}
