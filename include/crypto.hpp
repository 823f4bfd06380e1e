/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_CRYPTO_HPP
#define GAMECAST_CRYPTO_HPP

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace gamecast::crypto {

    constexpr size_t SESSION_KEY_SIZE = 16;     // AES-128
    constexpr size_t SEAL_IV_SIZE = 12;
    constexpr size_t SEAL_TAG_SIZE = 16;
    constexpr size_t SEAL_OVERHEAD = SEAL_IV_SIZE + SEAL_TAG_SIZE;

/**
 * @brief Per-session key material, issued by the host in the ANSWER.
 *
 * The ANSWER travels over the TLS control channel; the key then protects the
 * client's input datagrams, which do not.
 */
    struct SessionKeys {
        uint32_t key_id = 0;
        std::array<uint8_t, SESSION_KEY_SIZE> key{};

        /// An all-zero key with id 0 means "no keys issued".
        bool valid() const;
        bool operator==(const SessionKeys &o) const { return key_id == o.key_id && key == o.key; }
    };

    /// Fresh random keys. False when the system RNG fails.
    bool generate_session_keys(SessionKeys &out);

    /**
     * @brief AES-128-GCM seal of @p plain.
     *
     * Output: iv(12) | ciphertext | tag(16). The key id is authenticated as
     * associated data, so a datagram sealed under older keys fails to open.
     */
    bool seal(const SessionKeys &keys, const uint8_t *plain, size_t len, std::vector<uint8_t> &out);

    /// Inverse of seal(). False on truncation or authentication failure.
    bool open(const SessionKeys &keys, const uint8_t *sealed, size_t len, std::vector<uint8_t> &out);

} // namespace gamecast::crypto

#endif // GAMECAST_CRYPTO_HPP
