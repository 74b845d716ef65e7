#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace connmon::infra {

/**
 * @brief Encrypts configuration secrets such as webhook URLs.
 *
 * Uses libsodium's crypto_secretbox with a key kept beside the config file.
 * The key file is created on first use with owner-only permissions. Values
 * are stored as base64 of nonce followed by ciphertext.
 *
 * @note This class is non-copyable.
 */
class SecureStorage {
public:
    explicit SecureStorage(const std::filesystem::path& keyPath);

    /**
     * @brief Zeroes the key material.
     */
    ~SecureStorage();

    SecureStorage(const SecureStorage&) = delete;
    SecureStorage& operator=(const SecureStorage&) = delete;

    /**
     * @brief Encrypts a secret.
     * @return Encoded ciphertext, or nullopt if no key is available.
     */
    std::optional<std::string> encrypt(const std::string& plaintext) const;

    /**
     * @brief Decrypts a value produced by encrypt().
     * @return Plaintext, or nullopt if the value is malformed or was encrypted
     *         with a different key.
     */
    std::optional<std::string> decrypt(const std::string& encoded) const;

    bool isReady() const { return ready_; }

    const std::filesystem::path& keyPath() const { return keyPath_; }

private:
    bool loadKey();
    bool createKey();

    std::filesystem::path keyPath_;
    std::vector<unsigned char> key_;
    bool ready_{false};
};

} // namespace connmon::infra
