#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace framecast::protocol {

// On-wire chunk header (big-endian, no padding)
//   0  4  frame_id
//   4  2  total_chunks
//   6  2  chunk_index
//   8  N  payload
struct ChunkHeader {
    static constexpr size_t SIZE = 8;

    uint32_t frame_id{0};
    uint16_t total_chunks{0};
    uint16_t chunk_index{0};

    // total_chunks > 0 and chunk_index < total_chunks
    [[nodiscard]] bool is_valid() const {
        return total_chunks > 0 && chunk_index < total_chunks;
    }

    bool operator==(const ChunkHeader& other) const = default;
};

// Parsed datagram; payload points into the caller's buffer
struct ParsedChunk {
    ChunkHeader header;
    std::span<const uint8_t> payload;
};

enum class ParseError {
    SUCCESS,
    PACKET_TOO_SHORT,
    INVALID_HEADER
};

const char* parse_error_to_string(ParseError error);

// Write the 8-byte header into out (must hold at least SIZE bytes)
void write_header(const ChunkHeader& header, std::span<uint8_t> out);

// Header followed by payload, ready for a single datagram
std::vector<uint8_t> encode_chunk(const ChunkHeader& header, std::span<const uint8_t> payload);

// Read the header without validating it
std::optional<ChunkHeader> read_header(std::span<const uint8_t> data);

// Parse and validate a received datagram
std::optional<ParsedChunk> parse_chunk(std::span<const uint8_t> datagram,
                                       ParseError* error = nullptr);

}  // namespace framecast::protocol
