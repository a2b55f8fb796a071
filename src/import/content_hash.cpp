#include "ingest/import/content_hash.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

namespace ingest::import {

void ContentHash::update(const void* data, std::size_t size) noexcept {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < size; ++i) {
        state_ ^= static_cast<std::uint64_t>(bytes[i]);
        state_ *= kPrime;
    }
}

std::string ContentHash::hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(state_) * 2) << std::setfill('0') << state_;
    return oss.str();
}

std::string hash_bytes(const std::string& data) {
    ContentHash hash;
    hash.update(data.data(), data.size());
    return hash.hex();
}

std::string hash_stream(std::istream& input, std::size_t buffer_size) {
    ContentHash hash;
    std::vector<char> buffer(buffer_size == 0 ? 4096 : buffer_size);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        hash.update(buffer.data(), static_cast<std::size_t>(input.gcount()));
    }
    return hash.hex();
}

} // namespace ingest::import
