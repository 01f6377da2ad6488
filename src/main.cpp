#include <iostream>
#include <string>
#include <vector>

#include "cipher/Feistel/feistel.hpp"
#include "utils/DataConverter.hpp"

int main() {
	const std::vector<uint8_t> block = DataConverter::StringToBytes("budapesh");
	const std::vector<uint8_t> key = DataConverter::StringToBytes("rust");
	const size_t rounds = 10;

	try {
		std::vector<uint8_t> encrypted = Feistel::CryptBlock(block, key, false, rounds);
		std::vector<uint8_t> decrypted = Feistel::CryptBlock(encrypted, key, true, rounds);

		std::cout << "plaintext : " << DataConverter::BytesToList(block)
			<< "  " << DataConverter::BytesToHex(block) << "\n";
		std::cout << "encrypted : " << DataConverter::BytesToList(encrypted)
			<< "  " << DataConverter::BytesToHex(encrypted) << "\n";
		std::cout << "decrypted : " << DataConverter::BytesToList(decrypted)
			<< "  " << DataConverter::BytesToHex(decrypted) << "\n";

		if (decrypted != block) {
			std::cerr << "Round trip FAILED\n";
			return 1;
		}
	}
	catch (const std::exception& e) {
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}
	return 0;
}
