#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

namespace ingest::import {

/**
 * @brief Streaming 64-bit FNV-1a digest rendered as 16 lowercase hex chars
 *
 * Depends only on the bytes fed in, never on path or filename, so the same
 * value serves as integrity check and deduplication key.
 */
class ContentHash {
public:
    void update(const void* data, std::size_t size) noexcept;
    std::string hex() const;
    void reset() noexcept { state_ = kOffsetBasis; }

private:
    static constexpr std::uint64_t kOffsetBasis = 0xcbf29ce484222325ULL;
    static constexpr std::uint64_t kPrime = 0x100000001b3ULL;

    std::uint64_t state_ = kOffsetBasis;
};

std::string hash_bytes(const std::string& data);
std::string hash_stream(std::istream& input, std::size_t buffer_size = 64 * 1024);

} // namespace ingest::import
