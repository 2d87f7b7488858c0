#ifndef VERSO_SHA256_H
#define VERSO_SHA256_H

#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

namespace verso::crypto {

    class SHA256 {
    public:
        SHA256() { reset(); }

        void update(const void* data, size_t len) {
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            for (size_t i = 0; i < len; ++i) {
                m_block[m_used++] = bytes[i];
                if (m_used == 64) {
                    compress();
                    m_length += 512;
                    m_used = 0;
                }
            }
        }

        void update(const std::string& text) { update(text.data(), text.size()); }

        /**
         * @brief Pads the final block and returns the lowercase hex digest.
         */
        std::string final() {
            uint64_t total_bits = m_length + static_cast<uint64_t>(m_used) * 8;

            m_block[m_used++] = 0x80;
            if (m_used > 56) {
                while (m_used < 64) m_block[m_used++] = 0x00;
                compress();
                m_used = 0;
            }
            while (m_used < 56) m_block[m_used++] = 0x00;
            for (int i = 7; i >= 0; --i) {
                m_block[m_used++] = static_cast<uint8_t>(total_bits >> (i * 8));
            }
            compress();

            std::ostringstream out;
            for (uint32_t word : m_state) {
                out << std::hex << std::setw(8) << std::setfill('0') << word;
            }
            reset();
            return out.str();
        }

        static std::string hash_string(const std::string& text) {
            SHA256 sha;
            sha.update(text);
            return sha.final();
        }

        /**
         * @brief Hashes a file's content. Returns an empty string if it cannot be read.
         */
        static std::string hash_file(const std::string& path) {
            std::ifstream file(path, std::ios::binary);
            if (!file) return "";

            SHA256 sha;
            char buffer[4096];
            while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
                sha.update(buffer, static_cast<size_t>(file.gcount()));
            }
            return sha.final();
        }

    private:
        uint32_t m_state[8];
        uint8_t m_block[64];
        uint32_t m_used;
        uint64_t m_length;

        static constexpr uint32_t kRound[64] = {
            0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
            0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
            0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
            0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
            0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
            0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
            0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
            0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
        };

        void reset() {
            m_state[0] = 0x6a09e667;
            m_state[1] = 0xbb67ae85;
            m_state[2] = 0x3c6ef372;
            m_state[3] = 0xa54ff53a;
            m_state[4] = 0x510e527f;
            m_state[5] = 0x9b05688c;
            m_state[6] = 0x1f83d9ab;
            m_state[7] = 0x5be0cd19;
            m_used = 0;
            m_length = 0;
            memset(m_block, 0, sizeof(m_block));
        }

        void compress() {
            uint32_t w[64];
            for (int i = 0; i < 16; ++i) {
                w[i] = (uint32_t(m_block[i * 4]) << 24) | (uint32_t(m_block[i * 4 + 1]) << 16) |
                       (uint32_t(m_block[i * 4 + 2]) << 8) | uint32_t(m_block[i * 4 + 3]);
            }
            for (int i = 16; i < 64; ++i) {
                w[i] = sig1(w[i - 2]) + w[i - 7] + sig0(w[i - 15]) + w[i - 16];
            }

            uint32_t a = m_state[0], b = m_state[1], c = m_state[2], d = m_state[3];
            uint32_t e = m_state[4], f = m_state[5], g = m_state[6], h = m_state[7];

            for (int i = 0; i < 64; ++i) {
                uint32_t t1 = h + ep1(e) + ((e & f) ^ (~e & g)) + kRound[i] + w[i];
                uint32_t t2 = ep0(a) + ((a & b) ^ (a & c) ^ (b & c));
                h = g; g = f; f = e; e = d + t1;
                d = c; c = b; b = a; a = t1 + t2;
            }

            m_state[0] += a; m_state[1] += b; m_state[2] += c; m_state[3] += d;
            m_state[4] += e; m_state[5] += f; m_state[6] += g; m_state[7] += h;
        }

        static uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }
        static uint32_t sig0(uint32_t x) { return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3); }
        static uint32_t sig1(uint32_t x) { return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10); }
        static uint32_t ep0(uint32_t x) { return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22); }
        static uint32_t ep1(uint32_t x) { return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25); }
    };

}
#endif
