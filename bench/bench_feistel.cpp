#include <chrono>
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <cstring>
#include <iomanip>
#include <stdexcept>

#include "cipher/Feistel/feistel.hpp"
#include "utils/RNG.hpp"
#include "adapters/openssl_adapter.hpp"

using Clock = std::chrono::high_resolution_clock;

struct BenchResult {
    std::string algo;
    size_t blockSize;
    size_t rounds;
    size_t size;
    double mbps;
    double usec_per_op;
};

// Encrypts `dataSize` bytes block by block, `iters` times
static BenchResult bench_cipher(const std::string& algo,
    Cipher& cipher,
    const std::vector<uint8_t>& key,
    size_t rounds,
    size_t dataSize,
    size_t iters)
{
    cipher.setKey(key);
    const size_t B = cipher.blockSize();
    const size_t blocks = dataSize / B;

    utils::TestCSPRNG rng;
    std::vector<uint8_t> buf = rng.randomBytes(blocks * B);

    // Warmup
    for (size_t b = 0; b < blocks; ++b)
        cipher.encryptBlock(&buf[b * B], &buf[b * B]);

    auto start = Clock::now();
    for (size_t i = 0; i < iters; ++i) {
        for (size_t b = 0; b < blocks; ++b)
            cipher.encryptBlock(&buf[b * B], &buf[b * B]);
    }
    auto end = Clock::now();

    auto dur = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    double seconds = dur > 0 ? dur / 1e6 : 1e-6;
    double total_bytes = static_cast<double>(blocks * B) * iters;
    double mbps = (total_bytes / (1024.0 * 1024.0)) / seconds;
    double usec_per_op = static_cast<double>(dur) / iters;

    return { algo, B, rounds, blocks * B, mbps, usec_per_op };
}

int main(int argc, char** argv)
{
    std::string outFile = "bench_results.csv";
    size_t iters = 20;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            outFile = argv[++i];
        } else if (std::strcmp(argv[i], "--iters") == 0 && i + 1 < argc) {
            iters = std::stoul(argv[++i]);
        }
    }

    std::vector<size_t> sizes = { 1024, 16384, 65536 };
    std::vector<size_t> keySizes = { 4, 8, 16 };
    std::vector<size_t> roundCounts = { 10, 16, 32 };
    std::vector<BenchResult> results;

    utils::TestCSPRNG keyRng(0x5EED);

    try {
        std::cerr << "[*] Starting benchmarks (iters=" << iters << ")...\n";

        for (auto size : sizes) {
            for (auto keySize : keySizes) {
                for (auto rounds : roundCounts) {
                    std::cerr << "[*] Feistel block=" << keySize * 2 << " rounds=" << rounds << " size=" << size << "\n";
                    Feistel feistel;
                    feistel.setRounds(rounds);
                    results.push_back(bench_cipher("Feistel", feistel, keyRng.randomBytes(keySize), rounds, size, iters));
                }
            }

            // 3DES baseline (key=24, block=8, 3x16 DES rounds)
            std::cerr << "[*] OpenSSL 3DES ECB size=" << size << "\n";
            OpenSSL_3DES_ECB_Adapter tdes;
            results.push_back(bench_cipher("3DES-" + tdes.sourceName(), tdes, keyRng.randomBytes(24), 48, size, iters));
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::ofstream ofs(outFile);
    ofs << "algo,block_bytes,rounds,size_bytes,throughput_MBps,latency_usec\n";
    for (auto& r : results) {
        ofs << r.algo << ","
            << r.blockSize << ","
            << r.rounds << ","
            << r.size << ","
            << std::fixed << std::setprecision(2) << r.mbps << ","
            << std::fixed << std::setprecision(2) << r.usec_per_op << "\n";
    }

    std::cerr << "\n[*] Results saved to " << outFile << "\n";
    std::cerr << "\n=== Summary ===\n";
    std::cerr << std::left << std::setw(14) << "Algorithm"
              << std::setw(7) << "Block"
              << std::setw(8) << "Rounds"
              << std::setw(10) << "Size"
              << std::setw(16) << "Throughput"
              << "Latency\n";
    std::cerr << std::string(64, '-') << "\n";
    for (auto& r : results) {
        std::cerr << std::left << std::setw(14) << r.algo
                  << std::setw(7) << r.blockSize
                  << std::setw(8) << r.rounds
                  << std::setw(10) << r.size
                  << std::fixed << std::setprecision(2)
                  << std::setw(11) << r.mbps << " MB/s"
                  << std::setw(10) << r.usec_per_op << " us\n";
    }

    return 0;
}
