#include "utils/ByteOps.hpp"
#include <algorithm>

namespace utils {

	std::vector<uint8_t> XorBytes(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
		const size_t n = std::min(a.size(), b.size());
		std::vector<uint8_t> out(n);
		for (size_t i = 0; i < n; i++) {
			out[i] = static_cast<uint8_t>(a[i] ^ b[i]);
		}
		return out;
	}

	std::vector<uint8_t> ComplementBytes(const std::vector<uint8_t>& a) {
		std::vector<uint8_t> out(a.size());
		std::transform(a.begin(), a.end(), out.begin(),
			[](uint8_t x) { return static_cast<uint8_t>(~x); });
		return out;
	}

	std::vector<uint8_t> ShiftLeftBytes(const std::vector<uint8_t>& a) {
		std::vector<uint8_t> out(a.size());
		std::transform(a.begin(), a.end(), out.begin(),
			[](uint8_t x) { return static_cast<uint8_t>(x << 1); });
		return out;
	}

	void SecureWipe(uint8_t* p, size_t n) noexcept {
		volatile uint8_t* v = p;
		while (n--) *v++ = 0;
	}

	void SecureWipe(std::vector<uint8_t>& a) noexcept {
		SecureWipe(a.data(), a.size());
	}

} // namespace utils
