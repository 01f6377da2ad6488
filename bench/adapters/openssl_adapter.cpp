#include "openssl_adapter.hpp"
#include <openssl/crypto.h>
#include <stdexcept>

OpenSSL_3DES_ECB_Adapter::OpenSSL_3DES_ECB_Adapter()
    : ctx_(EVP_CIPHER_CTX_new())
{
    if (!ctx_) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
}

OpenSSL_3DES_ECB_Adapter::~OpenSSL_3DES_ECB_Adapter() {
    if (ctx_) {
        EVP_CIPHER_CTX_free(ctx_);
    }
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

void OpenSSL_3DES_ECB_Adapter::setKey(const std::vector<uint8_t>& key) {
    if (key.size() != 24) {
        throw std::runtime_error("OpenSSL_3DES_ECB_Adapter: key must be 24 bytes");
    }
    key_ = key;
}

void OpenSSL_3DES_ECB_Adapter::encryptBlock(const uint8_t* in, uint8_t* out) const {
    run(in, out, 1);
}

void OpenSSL_3DES_ECB_Adapter::decryptBlock(const uint8_t* in, uint8_t* out) const {
    run(in, out, 0);
}

void OpenSSL_3DES_ECB_Adapter::run(const uint8_t* in, uint8_t* out, int enc) const {
    if (!in || !out) return;
    if (key_.empty()) {
        throw std::runtime_error("Key not set");
    }

    if (EVP_CipherInit_ex(ctx_, EVP_des_ede3_ecb(), nullptr, key_.data(), nullptr, enc) != 1) {
        throw std::runtime_error("EVP_CipherInit_ex failed");
    }
    EVP_CIPHER_CTX_set_padding(ctx_, 0);

    // in == out is fine for a single ECB block
    int outlen = 0;
    if (EVP_CipherUpdate(ctx_, out, &outlen, in, static_cast<int>(blockSize())) != 1) {
        throw std::runtime_error("EVP_CipherUpdate failed");
    }

    int finlen = 0;
    if (EVP_CipherFinal_ex(ctx_, out + outlen, &finlen) != 1) {
        throw std::runtime_error("EVP_CipherFinal_ex failed");
    }
}
