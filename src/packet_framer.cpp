#include "packet_framer.h"
#include <cstring>

namespace xtrans {

namespace {

void write_u32_be(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint32_t read_u32_be(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

} // namespace

std::vector<uint8_t> PacketFramer::encode(const std::string& file_id, uint32_t chunk_index,
                                          const uint8_t* data, size_t size,
                                          XtransError* error) {
    if (file_id.size() > PACKET_FILE_ID_SIZE) {
        set_error(error, XtransErrorCode::INVALID_FILE_ID,
                  "file id is " + std::to_string(file_id.size()) + " bytes, limit is " +
                  std::to_string(PACKET_FILE_ID_SIZE));
        return {};
    }

    std::vector<uint8_t> frame;
    frame.reserve(PACKET_HEADER_SIZE + size);

    // Magic (4 bytes)
    write_u32_be(frame, PACKET_MAGIC);

    // File id (36 bytes, null padded)
    frame.insert(frame.end(), file_id.begin(), file_id.end());
    frame.resize(PACKET_MAGIC_SIZE + PACKET_FILE_ID_SIZE, 0);

    // Chunk index (4 bytes)
    write_u32_be(frame, chunk_index);

    if (size > 0) {
        frame.insert(frame.end(), data, data + size);
    }

    return frame;
}

std::vector<uint8_t> PacketFramer::encode(const std::string& file_id, uint32_t chunk_index,
                                          const std::vector<uint8_t>& payload,
                                          XtransError* error) {
    return encode(file_id, chunk_index, payload.data(), payload.size(), error);
}

bool PacketFramer::is_chunk_frame(const uint8_t* data, size_t length) {
    return data != nullptr && length >= PACKET_HEADER_SIZE && read_u32_be(data) == PACKET_MAGIC;
}

std::optional<ChunkFrame> PacketFramer::decode(const uint8_t* data, size_t length) {
    if (!is_chunk_frame(data, length)) {
        return std::nullopt;
    }

    ChunkFrame frame;

    // File id (offset 4), trailing null padding stripped
    const char* id_begin = reinterpret_cast<const char*>(data + PACKET_MAGIC_SIZE);
    size_t id_length = PACKET_FILE_ID_SIZE;
    while (id_length > 0 && id_begin[id_length - 1] == '\0') {
        id_length--;
    }
    frame.file_id.assign(id_begin, id_length);

    // Chunk index (offset 40)
    frame.chunk_index = read_u32_be(data + PACKET_MAGIC_SIZE + PACKET_FILE_ID_SIZE);

    // Payload (offset 44)
    frame.payload.assign(data + PACKET_HEADER_SIZE, data + length);

    return frame;
}

std::optional<ChunkFrame> PacketFramer::decode(const std::vector<uint8_t>& data) {
    return decode(data.data(), data.size());
}

} // namespace xtrans
