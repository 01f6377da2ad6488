#include "cipher/Feistel/feistel.hpp"
#include <algorithm>
#include <utility>

// ================= Round keys =================

Feistel::RoundKey Feistel::PermuteWord(Bytes word, size_t roundIndex)
{
    const size_t n = word.size();
    if (n == 0) return word;

    // swaps cascade: each step sees the result of the previous one
    for (size_t i = 0; i < n; ++i) {
        size_t newIndex = (i + roundIndex) % n;
        std::swap(word[i], word[newIndex]);
    }
    return word;
}

Feistel::KeySchedule Feistel::GenerateRoundKeys(const Bytes& key, bool decrypt, size_t rounds)
{
    KeySchedule keys;
    keys.reserve(rounds);

    for (size_t round = 0; round < rounds; ++round) {
        keys.push_back(PermuteWord(key, round));
    }

    if (decrypt) {
        std::reverse(keys.begin(), keys.end());
    }
    return keys;
}
