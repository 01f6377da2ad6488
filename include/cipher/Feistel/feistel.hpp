#pragma once
#include <cstdint>
#include <stdexcept>
#include <vector>
#include <cipher/cipher.hpp>

// Raised before any round runs when block/key lengths cannot form a valid call
class InvalidParameters : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

class Feistel : public Cipher
{
public:
	using Bytes = std::vector<uint8_t>;
	using RoundKey = Bytes;
	using KeySchedule = std::vector<RoundKey>;

	static constexpr size_t DEFAULT_ROUNDS = 10;

	Feistel();
	explicit Feistel(const Bytes& key, size_t rounds = DEFAULT_ROUNDS);
	~Feistel() override;

	void setKey(const Bytes& key) override;
	void setRounds(size_t rounds);
	size_t rounds() const;

	// Twice the key length, 0 while no key is set
	size_t blockSize() const override;

	void encryptBlock(const uint8_t* in, uint8_t* out) const override;
	void decryptBlock(const uint8_t* in, uint8_t* out) const override;

	Bytes encrypt(const Bytes& block) const;
	Bytes decrypt(const Bytes& block) const;

	// Full cipher: every round of the schedule, then the final half swap.
	// Throws InvalidParameters for an empty or odd block, or when
	// key.size() != block.size() / 2.
	static Bytes CryptBlock(const Bytes& block, const Bytes& key, bool decrypt, size_t rounds);

	// One round: [L, R] -> [R, L ^ F(R, k)]
	static Bytes CryptRound(const Bytes& block, const RoundKey& roundKey);

	// F(R, k) = shl1(~(R ^ k)), lossy on purpose
	static Bytes FeistelFunction(const Bytes& half, const RoundKey& roundKey);

	// Cascading swap of word[i] and word[(i + roundIndex) % n] for ascending i
	static RoundKey PermuteWord(Bytes word, size_t roundIndex);

	static KeySchedule GenerateRoundKeys(const Bytes& key, bool decrypt, size_t rounds);

private:
	static void ValidateParameters(const Bytes& block, const Bytes& key);

	void Process(const uint8_t* in, uint8_t* out, bool decrypt) const;

	Bytes key_;
	size_t rounds_ = DEFAULT_ROUNDS;
};
