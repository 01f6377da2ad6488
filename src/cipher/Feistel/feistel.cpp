#include "cipher/Feistel/feistel.hpp"
#include "utils/ByteOps.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

Feistel::Feistel() = default;

Feistel::Feistel(const Bytes& key, size_t rounds)
    : rounds_(rounds)
{
    setKey(key);
}

Feistel::~Feistel()
{
    utils::SecureWipe(key_);
}

void Feistel::setKey(const Bytes& key)
{
    if (key.empty()) {
        throw InvalidParameters("Feistel::setKey: key must not be empty");
    }

    utils::SecureWipe(key_);
    key_ = key;
}

void Feistel::setRounds(size_t rounds)
{
    rounds_ = rounds;
}

size_t Feistel::rounds() const
{
    return rounds_;
}

size_t Feistel::blockSize() const
{
    return key_.size() * 2;
}

void Feistel::encryptBlock(const uint8_t* in, uint8_t* out) const
{
    if (!in || !out) return;
    Process(in, out, false);
}

void Feistel::decryptBlock(const uint8_t* in, uint8_t* out) const
{
    if (!in || !out) return;
    Process(in, out, true);
}

Feistel::Bytes Feistel::encrypt(const Bytes& block) const
{
    if (block.size() != blockSize()) {
        throw InvalidParameters("Feistel::encrypt: expected " + std::to_string(blockSize())
            + " bytes, got " + std::to_string(block.size()));
    }
    Bytes out(block.size());
    Process(block.data(), out.data(), false);
    return out;
}

Feistel::Bytes Feistel::decrypt(const Bytes& block) const
{
    if (block.size() != blockSize()) {
        throw InvalidParameters("Feistel::decrypt: expected " + std::to_string(blockSize())
            + " bytes, got " + std::to_string(block.size()));
    }
    Bytes out(block.size());
    Process(block.data(), out.data(), true);
    return out;
}

void Feistel::Process(const uint8_t* in, uint8_t* out, bool decrypt) const
{
    if (key_.empty()) {
        throw std::runtime_error("Feistel: key not set");
    }

    Bytes block(in, in + blockSize());
    Bytes result = CryptBlock(block, key_, decrypt, rounds_);
    std::memcpy(out, result.data(), result.size());

    utils::SecureWipe(block);
    utils::SecureWipe(result);
}

// ================= Feistel network =================

void Feistel::ValidateParameters(const Bytes& block, const Bytes& key)
{
    if (block.empty()) {
        throw InvalidParameters("Feistel: block must not be empty");
    }
    if (block.size() % 2 != 0) {
        throw InvalidParameters("Feistel: block length must be even, got " + std::to_string(block.size()));
    }
    if (key.size() != block.size() / 2) {
        throw InvalidParameters("Feistel: key must be half the block length ("
            + std::to_string(block.size() / 2) + " bytes), got " + std::to_string(key.size()));
    }
}

Feistel::Bytes Feistel::CryptBlock(const Bytes& block, const Bytes& key, bool decrypt, size_t rounds)
{
    ValidateParameters(block, key);

    KeySchedule keys = GenerateRoundKeys(key, decrypt, rounds);

    Bytes state = block;
    for (RoundKey& roundKey : keys) {
        Bytes next = CryptRound(state, roundKey);
        utils::SecureWipe(state);
        utils::SecureWipe(roundKey);
        state = std::move(next);
    }

    // undo the swap left by the last round
    const size_t half = state.size() / 2;
    Bytes out;
    out.reserve(state.size());
    out.insert(out.end(), state.begin() + half, state.end());
    out.insert(out.end(), state.begin(), state.begin() + half);
    utils::SecureWipe(state);
    return out;
}

Feistel::Bytes Feistel::CryptRound(const Bytes& block, const RoundKey& roundKey)
{
    const size_t half = block.size() / 2;
    Bytes left(block.begin(), block.begin() + half);
    Bytes right(block.begin() + half, block.end());

    Bytes mask = FeistelFunction(right, roundKey);
    Bytes newRight = utils::XorBytes(left, mask);
    utils::SecureWipe(left);
    utils::SecureWipe(mask);

    Bytes out;
    out.reserve(block.size());
    out.insert(out.end(), right.begin(), right.end());
    out.insert(out.end(), newRight.begin(), newRight.end());
    utils::SecureWipe(right);
    utils::SecureWipe(newRight);
    return out;
}

Feistel::Bytes Feistel::FeistelFunction(const Bytes& half, const RoundKey& roundKey)
{
    return utils::ShiftLeftBytes(utils::ComplementBytes(utils::XorBytes(half, roundKey)));
}
