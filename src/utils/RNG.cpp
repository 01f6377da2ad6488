#include "utils/RNG.hpp"
#include <random>

namespace utils {

	std::vector<uint8_t> CSPRNG::randomBytes(size_t size) {
		std::vector<uint8_t> data(size);
		fill(data.data(), data.size());
		return data;
	}

	uint64_t CSPRNG::randomUint64() {
		uint8_t bytes[8];
		fill(bytes, sizeof(bytes));
		uint64_t val = 0;
		for (uint8_t b : bytes) {
			val = (val << 8) | b;
		}
		return val;
	}

	void OSCSPRNG::fill(uint8_t* out, size_t size) {
		// NOTE: std::random_device may not be cryptographically secure on all platforms
		std::random_device rd;
		size_t i = 0;
		while (i < size) {
			uint32_t val = rd();
			for (int b = 0; b < 4 && i < size; b++, i++) {
				out[i] = static_cast<uint8_t>(val >> (b * 8));
			}
		}
	}

	TestCSPRNG::TestCSPRNG(uint64_t seed)
		: state(seed) {
	}

	void TestCSPRNG::fill(uint8_t* out, size_t size) {
		for (size_t i = 0; i < size; i++) {
			state = state * 6364136223846793005ULL + 1;
			out[i] = static_cast<uint8_t>(state >> 32);
		}
	}


} // namespace utils
