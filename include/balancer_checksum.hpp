/**
 * @file balancer_checksum.hpp
 * @brief CRC32 checksums for copy verification
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef POOLBALANCER_BALANCER_CHECKSUM_HPP
#define POOLBALANCER_BALANCER_CHECKSUM_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace poolbalancer {

/**
 * @class CRC32
 * @brief Streaming CRC-32 (reflected, polynomial 0xEDB88320)
 */
class CRC32 {
public:
    void feed(const char* data, size_t n) {
        static const auto table = buildTable();
        for (size_t i = 0; i < n; ++i) {
            state_ = table[(state_ ^ static_cast<uint8_t>(data[i])) & 0xFFu] ^ (state_ >> 8);
        }
    }

    [[nodiscard]] uint32_t digest() const noexcept { return ~state_; }

    /// Reads @p path in 64 KiB chunks; nullopt when it cannot be opened or read
    [[nodiscard]] static std::optional<uint32_t> computeFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) return std::nullopt;
        CRC32 crc;
        std::vector<char> chunk(64 * 1024);
        while (in.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || in.gcount() > 0) {
            crc.feed(chunk.data(), static_cast<size_t>(in.gcount()));
            if (in.eof()) break;
        }
        if (in.bad()) return std::nullopt;
        return crc.digest();
    }

private:
    static std::array<uint32_t, 256> buildTable() {
        std::array<uint32_t, 256> table{};
        for (uint32_t n = 0; n < table.size(); ++n) {
            uint32_t c = n;
            for (int bit = 0; bit < 8; ++bit) c = (c & 1u) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
            table[n] = c;
        }
        return table;
    }

    uint32_t state_ = 0xFFFFFFFFu;
};

} // namespace poolbalancer
#endif // POOLBALANCER_BALANCER_CHECKSUM_HPP
