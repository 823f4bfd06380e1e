/*
* @license
* (C) zachbabanov
*
*/

#include <crypto.hpp>
#include <logger.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>

namespace gamecast::crypto {

namespace {

    struct CipherCtxFree {
        void operator()(EVP_CIPHER_CTX *c) const { EVP_CIPHER_CTX_free(c); }
    };
    using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxFree>;

    void key_id_aad(uint32_t key_id, uint8_t out[4]) {
        out[0] = (uint8_t)(key_id >> 24);
        out[1] = (uint8_t)(key_id >> 16);
        out[2] = (uint8_t)(key_id >> 8);
        out[3] = (uint8_t)key_id;
    }

} // namespace

    bool SessionKeys::valid() const {
        return key_id != 0 || std::any_of(key.begin(), key.end(), [](uint8_t b) { return b != 0; });
    }

    bool generate_session_keys(SessionKeys &out) {
        SessionKeys k;
        uint8_t id[4];
        do {
            if (RAND_bytes(k.key.data(), (int)k.key.size()) != 1 || RAND_bytes(id, sizeof(id)) != 1) {
                LOG_SESSION_ERROR("RAND_bytes failed: {}", ERR_get_error());
                return false;
            }
            k.key_id = ((uint32_t)id[0] << 24) | ((uint32_t)id[1] << 16) | ((uint32_t)id[2] << 8) | id[3];
        } while (!k.valid());
        out = k;
        return true;
    }

    bool seal(const SessionKeys &keys, const uint8_t *plain, size_t len, std::vector<uint8_t> &out) {
        CipherCtx ctx(EVP_CIPHER_CTX_new());
        if (!ctx) return false;

        std::vector<uint8_t> sealed(SEAL_IV_SIZE + len + SEAL_TAG_SIZE);
        uint8_t *iv = sealed.data();
        if (RAND_bytes(iv, (int)SEAL_IV_SIZE) != 1) return false;

        uint8_t aad[4];
        key_id_aad(keys.key_id, aad);
        int n = 0;
        int total = 0;
        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, (int)SEAL_IV_SIZE, nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, keys.key.data(), iv) != 1 ||
            EVP_EncryptUpdate(ctx.get(), nullptr, &n, aad, sizeof(aad)) != 1) {
            return false;
        }
        if (len > 0) {
            if (EVP_EncryptUpdate(ctx.get(), sealed.data() + SEAL_IV_SIZE, &n, plain, (int)len) != 1) return false;
            total = n;
        }
        if (EVP_EncryptFinal_ex(ctx.get(), sealed.data() + SEAL_IV_SIZE + total, &n) != 1) return false;
        total += n;
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, (int)SEAL_TAG_SIZE,
                                sealed.data() + SEAL_IV_SIZE + total) != 1) {
            return false;
        }
        out = std::move(sealed);
        return true;
    }

    bool open(const SessionKeys &keys, const uint8_t *sealed, size_t len, std::vector<uint8_t> &out) {
        if (!sealed || len < SEAL_OVERHEAD) return false;
        const size_t body = len - SEAL_OVERHEAD;
        const uint8_t *iv = sealed;
        const uint8_t *cipher = sealed + SEAL_IV_SIZE;
        uint8_t tag[SEAL_TAG_SIZE];
        std::copy(sealed + SEAL_IV_SIZE + body, sealed + len, tag);

        CipherCtx ctx(EVP_CIPHER_CTX_new());
        if (!ctx) return false;

        std::vector<uint8_t> plain(body + 1);   // never zero-sized, EVP wants a valid pointer
        uint8_t aad[4];
        key_id_aad(keys.key_id, aad);
        int n = 0;
        int total = 0;
        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, (int)SEAL_IV_SIZE, nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, keys.key.data(), iv) != 1 ||
            EVP_DecryptUpdate(ctx.get(), nullptr, &n, aad, sizeof(aad)) != 1) {
            return false;
        }
        if (body > 0) {
            if (EVP_DecryptUpdate(ctx.get(), plain.data(), &n, cipher, (int)body) != 1) return false;
            total = n;
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, (int)SEAL_TAG_SIZE, tag) != 1) return false;
        if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + total, &n) != 1) return false;   // tag mismatch
        total += n;
        plain.resize((size_t)total);
        out = std::move(plain);
        return true;
    }

} // namespace gamecast::crypto
