#include "infrastructure/crypto/SecureStorage.hpp"

#include <sodium.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <string>

namespace connmon::infra {

namespace {

constexpr size_t KEY_SIZE = crypto_secretbox_KEYBYTES;
constexpr size_t NONCE_SIZE = crypto_secretbox_NONCEBYTES;
constexpr size_t MAC_SIZE = crypto_secretbox_MACBYTES;
constexpr int BASE64_VARIANT = sodium_base64_VARIANT_ORIGINAL;

std::string toBase64(const std::vector<unsigned char>& data) {
    std::string encoded(sodium_base64_encoded_len(data.size(), BASE64_VARIANT), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), BASE64_VARIANT);
    // sodium writes a trailing NUL that is counted in the encoded length
    encoded.resize(std::char_traits<char>::length(encoded.c_str()));
    return encoded;
}

std::optional<std::vector<unsigned char>> fromBase64(const std::string& encoded) {
    std::vector<unsigned char> decoded(encoded.size());
    size_t decodedLen = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(), encoded.c_str(), encoded.size(),
                          nullptr, &decodedLen, nullptr, BASE64_VARIANT) != 0) {
        return std::nullopt;
    }
    decoded.resize(decodedLen);
    return decoded;
}

} // namespace

SecureStorage::SecureStorage(const std::filesystem::path& keyPath)
    : keyPath_(keyPath), key_(KEY_SIZE) {
    if (sodium_init() < 0) {
        spdlog::error("Failed to initialize libsodium, secure values are unavailable");
        return;
    }

    std::error_code ec;
    ready_ = std::filesystem::exists(keyPath_, ec) ? loadKey() : createKey();
}

SecureStorage::~SecureStorage() {
    sodium_memzero(key_.data(), key_.size());
}

bool SecureStorage::loadKey() {
    std::ifstream file(keyPath_, std::ios::binary);
    if (file) {
        file.read(reinterpret_cast<char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
        if (file.gcount() == static_cast<std::streamsize>(KEY_SIZE)) {
            spdlog::debug("Loaded secret key from {}", keyPath_.string());
            return true;
        }
    }

    // Never replace an existing key: values encrypted with it would be lost.
    spdlog::error("Secret key file {} is unreadable or truncated", keyPath_.string());
    return false;
}

bool SecureStorage::createKey() {
    crypto_secretbox_keygen(key_.data());

    std::error_code ec;
    auto parent = keyPath_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(keyPath_, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("Failed to create secret key file {}", keyPath_.string());
        return false;
    }
    file.write(reinterpret_cast<const char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
    file.close();

    std::filesystem::permissions(keyPath_,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 ec);
    if (ec) {
        spdlog::warn("Could not restrict permissions of {}: {}", keyPath_.string(), ec.message());
    }

    spdlog::info("Generated new secret key at {}", keyPath_.string());
    return true;
}

std::optional<std::string> SecureStorage::encrypt(const std::string& plaintext) const {
    if (!ready_) {
        spdlog::error("Cannot encrypt secret: no key available");
        return std::nullopt;
    }

    std::vector<unsigned char> box(NONCE_SIZE + MAC_SIZE + plaintext.size());
    unsigned char* nonce = box.data();
    randombytes_buf(nonce, NONCE_SIZE);

    if (crypto_secretbox_easy(box.data() + NONCE_SIZE,
                              reinterpret_cast<const unsigned char*>(plaintext.data()),
                              plaintext.size(), nonce, key_.data()) != 0) {
        spdlog::error("Encryption of secret failed");
        return std::nullopt;
    }

    return toBase64(box);
}

std::optional<std::string> SecureStorage::decrypt(const std::string& encoded) const {
    if (!ready_) {
        spdlog::error("Cannot decrypt secret: no key available");
        return std::nullopt;
    }

    auto box = fromBase64(encoded);
    if (!box || box->size() < NONCE_SIZE + MAC_SIZE) {
        spdlog::error("Secret value is not valid encoded ciphertext");
        return std::nullopt;
    }

    std::string plaintext(box->size() - NONCE_SIZE - MAC_SIZE, '\0');
    if (crypto_secretbox_open_easy(reinterpret_cast<unsigned char*>(plaintext.data()),
                                   box->data() + NONCE_SIZE, box->size() - NONCE_SIZE,
                                   box->data(), key_.data()) != 0) {
        spdlog::error("Secret value failed authentication");
        return std::nullopt;
    }
    return plaintext;
}

} // namespace connmon::infra
