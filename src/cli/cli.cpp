#include <CLI/CLI.hpp>
#include <string>
#include <vector>
#include <iostream>
#include <stdexcept>

#include <cipher/Feistel/feistel.hpp>
#include <utils/DataConverter.hpp>
#include <utils/RNG.hpp>

std::vector<uint8_t> decode(const std::string& input, const std::string& encoding) {
    if (encoding == "utf8") {
        return DataConverter::StringToBytes(input);
    }
    if (encoding == "hex") {
        return DataConverter::HexToBytes(input);
    }
    throw std::runtime_error("Unknown encoding: " + encoding);
}

std::string encode(const std::vector<uint8_t>& data, const std::string& encoding) {
    if (encoding == "hex") {
        return DataConverter::BytesToHex(data);
    }
    if (encoding == "utf8") {
        return DataConverter::BytesToString(data);
    }
    if (encoding == "list") {
        return DataConverter::BytesToList(data);
    }
    throw std::runtime_error("Unknown output encoding: " + encoding);
}

// --generate-key sizes the key from the block, so the block must be usable first
void validateBlockForKeyGeneration(const std::vector<uint8_t>& block) {
    if (block.empty() || block.size() % 2 != 0) {
        throw InvalidParameters("Cannot generate a key for a block of " + std::to_string(block.size()) + " bytes, length must be non-zero and even");
    }
}

int main(int argc, char** argv) {
    CLI::App app{"Feistel CLI - single block Feistel network encryption/decryption"};

    std::string text;
    std::string text_encoding = "utf8";

    std::string key;
    std::string key_encoding = "utf8";
    bool generate_key = false;

    size_t rounds = Feistel::DEFAULT_ROUNDS;
    std::string operation = "encrypt";
    std::string output_encoding = "hex";
    bool verbose = false;

    // Text options
    app.add_option("--text,-t", text, "Block to encrypt/decrypt")->required();
    app.add_option("--text-encoding", text_encoding, "Text encoding (utf8, hex)");

    // Key options
    auto* keyOpt = app.add_option("--key,-k", key, "Key, half the block length");
    app.add_option("--key-encoding", key_encoding, "Key encoding (utf8, hex)");
    app.add_flag("--generate-key", generate_key, "Generate a random key and print it (hex) to stderr")
        ->excludes(keyOpt);

    // Cipher options
    app.add_option("--rounds,-r", rounds, "Number of Feistel rounds");
    app.add_option("--operation,-o", operation, "Operation (encrypt, decrypt)");
    app.add_option("--output-encoding", output_encoding, "Output encoding (hex, utf8, list)");
    app.add_flag("--verbose,-v", verbose, "Print the round key schedule to stderr");

    CLI11_PARSE(app, argc, argv);

    try {
        auto block = decode(text, text_encoding);

        std::vector<uint8_t> key_bytes;
        if (generate_key) {
            validateBlockForKeyGeneration(block);
            utils::OSCSPRNG rng;
            key_bytes = rng.randomBytes(block.size() / 2);
            std::cerr << "Generated key: " << DataConverter::BytesToHex(key_bytes) << std::endl;
        } else if (!key.empty()) {
            key_bytes = decode(key, key_encoding);
        } else {
            throw std::runtime_error("A key is required (--key or --generate-key)");
        }

        bool decrypt;
        if (operation == "encrypt") {
            decrypt = false;
        } else if (operation == "decrypt") {
            decrypt = true;
        } else {
            throw std::runtime_error("Unknown operation: " + operation + ". Use 'encrypt' or 'decrypt'");
        }

        // block/key lengths are checked by the driver (InvalidParameters)
        auto result = Feistel::CryptBlock(block, key_bytes, decrypt, rounds);

        if (verbose) {
            auto schedule = Feistel::GenerateRoundKeys(key_bytes, decrypt, rounds);
            std::cerr << "[*] " << operation << ", " << rounds << " rounds\n";
            for (size_t i = 0; i < schedule.size(); ++i) {
                std::cerr << "[*] round " << i + 1 << " key " << DataConverter::BytesToHex(schedule[i]) << "\n";
            }
        }

        std::cout << encode(result, output_encoding) << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
