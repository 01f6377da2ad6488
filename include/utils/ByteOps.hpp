#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace utils {

	// Elementwise a[i] ^ b[i] over the shorter input, the tail of the longer one is dropped
	std::vector<uint8_t> XorBytes(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

	std::vector<uint8_t> ComplementBytes(const std::vector<uint8_t>& a);

	// Logical shift by one bit per byte, the top bit is lost
	std::vector<uint8_t> ShiftLeftBytes(const std::vector<uint8_t>& a);

	// Zero through a volatile pointer so the stores are not elided, size is kept
	void SecureWipe(uint8_t* p, size_t n) noexcept;
	void SecureWipe(std::vector<uint8_t>& a) noexcept;

} // namespace utils
