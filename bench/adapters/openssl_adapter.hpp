#pragma once
#include "cipher/cipher.hpp"
#include <openssl/evp.h>
#include <vector>
#include <string>

// Reference 3DES-EDE in ECB, one 8-byte block per call, no padding
class OpenSSL_3DES_ECB_Adapter : public Cipher {
public:
    OpenSSL_3DES_ECB_Adapter();
    ~OpenSSL_3DES_ECB_Adapter() override;

    OpenSSL_3DES_ECB_Adapter(const OpenSSL_3DES_ECB_Adapter&) = delete;
    OpenSSL_3DES_ECB_Adapter& operator=(const OpenSSL_3DES_ECB_Adapter&) = delete;

    size_t blockSize() const override { return 8; }

    void setKey(const std::vector<uint8_t>& key) override;

    void encryptBlock(const uint8_t* in, uint8_t* out) const override;
    void decryptBlock(const uint8_t* in, uint8_t* out) const override;

    std::string sourceName() const { return "OpenSSL"; }

private:
    void run(const uint8_t* in, uint8_t* out, int enc) const;

    EVP_CIPHER_CTX* ctx_;
    std::vector<uint8_t> key_; // 24 bytes (3-key 3DES)
};
