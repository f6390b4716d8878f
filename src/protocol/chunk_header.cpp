#include "framecast/protocol/chunk_header.hpp"

#include <algorithm>

namespace framecast::protocol {

namespace {

uint32_t read_u32(std::span<const uint8_t> data) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

uint16_t read_u16(std::span<const uint8_t> data) {
    return static_cast<uint16_t>((data[0] << 8) | data[1]);
}

void write_u32(std::span<uint8_t> out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<uint8_t>(value >> ((3 - i) * 8));
    }
}

void write_u16(std::span<uint8_t> out, uint16_t value) {
    out[0] = static_cast<uint8_t>(value >> 8);
    out[1] = static_cast<uint8_t>(value & 0xFF);
}

void set_error(ParseError* error, ParseError value) {
    if (error) {
        *error = value;
    }
}

}  // namespace

const char* parse_error_to_string(ParseError error) {
    switch (error) {
        case ParseError::SUCCESS: return "success";
        case ParseError::PACKET_TOO_SHORT: return "packet too short";
        case ParseError::INVALID_HEADER: return "invalid header";
    }
    return "unknown";
}

void write_header(const ChunkHeader& header, std::span<uint8_t> out) {
    write_u32(out.subspan(0, 4), header.frame_id);
    write_u16(out.subspan(4, 2), header.total_chunks);
    write_u16(out.subspan(6, 2), header.chunk_index);
}

std::vector<uint8_t> encode_chunk(const ChunkHeader& header, std::span<const uint8_t> payload) {
    std::vector<uint8_t> datagram(ChunkHeader::SIZE + payload.size());
    write_header(header, datagram);
    std::copy(payload.begin(), payload.end(), datagram.begin() + ChunkHeader::SIZE);
    return datagram;
}

std::optional<ChunkHeader> read_header(std::span<const uint8_t> data) {
    if (data.size() < ChunkHeader::SIZE) {
        return std::nullopt;
    }

    ChunkHeader header;
    header.frame_id = read_u32(data.subspan(0, 4));
    header.total_chunks = read_u16(data.subspan(4, 2));
    header.chunk_index = read_u16(data.subspan(6, 2));
    return header;
}

std::optional<ParsedChunk> parse_chunk(std::span<const uint8_t> datagram, ParseError* error) {
    auto header = read_header(datagram);
    if (!header) {
        set_error(error, ParseError::PACKET_TOO_SHORT);
        return std::nullopt;
    }

    if (!header->is_valid()) {
        set_error(error, ParseError::INVALID_HEADER);
        return std::nullopt;
    }

    set_error(error, ParseError::SUCCESS);
    return ParsedChunk{*header, datagram.subspan(ChunkHeader::SIZE)};
}

}  // namespace framecast::protocol
