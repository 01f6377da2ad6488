#pragma once
#include <vector>
#include <cstddef>
#include <cstdint>


namespace utils {


	class CSPRNG {
	public:
		virtual ~CSPRNG() = default;

		virtual void fill(uint8_t* out, size_t size) = 0;

		std::vector<uint8_t> randomBytes(size_t size);
		uint64_t randomUint64();
	};


	// std::random_device backed, used for key generation
	class OSCSPRNG : public CSPRNG {
	public:
		void fill(uint8_t* out, size_t size) override;
	};


	// Deterministic LCG stream, same seed gives the same bytes
	class TestCSPRNG : public CSPRNG {
	public:
		static constexpr uint64_t DEFAULT_SEED = 0xDEADBEEFCAFEBABEULL;

		explicit TestCSPRNG(uint64_t seed = DEFAULT_SEED);
		void fill(uint8_t* out, size_t size) override;
	private:
		uint64_t state;
	};


} // namespace utils
