#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

class DataConverter {
public:
    // TEXT <-> BYTES

    static std::vector<uint8_t> StringToBytes(const std::string& input) {
        return std::vector<uint8_t>(input.begin(), input.end());
    }

    static std::string BytesToString(const std::vector<uint8_t>& bytes) {
        return std::string(bytes.begin(), bytes.end());
    }

    // BYTES <-> HEX

    static std::vector<uint8_t> HexToBytes(const std::string& hex) {
        if (hex.size() % 2 != 0)
            throw std::invalid_argument("HexToBytes: hex length must be even");

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.size() / 2);

        for (std::size_t i = 0; i < hex.size(); i += 2) {
            uint8_t high = HexCharToValue(hex[i]);
            uint8_t low = HexCharToValue(hex[i + 1]);
            bytes.push_back(static_cast<uint8_t>((high << 4) | low));
        }
        return bytes;
    }

    static std::string BytesToHex(const std::vector<uint8_t>& bytes) {
        std::string out;
        out.reserve(bytes.size() * 2);

        for (uint8_t b : bytes) {
            out.push_back(ValueToHexChar(b >> 4));
            out.push_back(ValueToHexChar(b));
        }
        return out;
    }

    // BYTES -> "[98, 117, 100]"
    static std::string BytesToList(const std::vector<uint8_t>& bytes) {
        std::string out = "[";
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i != 0) out += ", ";
            out += std::to_string(static_cast<unsigned>(bytes[i]));
        }
        out += "]";
        return out;
    }

private:
    static uint8_t HexCharToValue(char c) {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        throw std::invalid_argument("Invalid hex character");
    }

    static char ValueToHexChar(uint8_t v) {
        static const char* hex = "0123456789ABCDEF";
        return hex[v & 0x0F];
    }
};
