#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

class Cipher {
public:
	virtual ~Cipher() = default;

	virtual void setKey(const std::vector<uint8_t>& key) = 0;

	// Size of one block in bytes
	virtual size_t blockSize() const = 0;

	// Transform exactly blockSize() bytes, in == out is allowed
	virtual void encryptBlock(const uint8_t* in, uint8_t* out) const = 0;
	virtual void decryptBlock(const uint8_t* in, uint8_t* out) const = 0;
};
