#pragma once

/**
 * @file packet_framer.h
 * @brief Binary file-chunk frames
 *
 * Frame layout (big-endian):
 * <magic:4><file_id:36><chunk_index:4><payload:N>
 *
 * Where:
 * - magic: 0x4244544C ("BDTL")
 * - file_id: UTF-8, null-padded to 36 bytes
 * - chunk_index: 0-based chunk number
 */

#include "errors.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace xtrans {

constexpr uint32_t PACKET_MAGIC = 0x4244544C;
constexpr size_t PACKET_MAGIC_SIZE = 4;
constexpr size_t PACKET_FILE_ID_SIZE = 36;
constexpr size_t PACKET_HEADER_SIZE = PACKET_MAGIC_SIZE + PACKET_FILE_ID_SIZE + 4;

/**
 * A decoded chunk frame
 */
struct ChunkFrame {
    std::string file_id;
    uint32_t chunk_index;
    std::vector<uint8_t> payload;

    ChunkFrame() : chunk_index(0) {}
    ChunkFrame(const std::string& id, uint32_t index, std::vector<uint8_t> data)
        : file_id(id), chunk_index(index), payload(std::move(data)) {}

    bool operator==(const ChunkFrame& other) const {
        return file_id == other.file_id &&
               chunk_index == other.chunk_index &&
               payload == other.payload;
    }
};

class PacketFramer {
public:
    /**
     * Encode a chunk frame.
     * @param file_id Transfer id, at most 36 bytes of UTF-8
     * @param chunk_index Chunk number
     * @param data Chunk payload
     * @param size Payload size
     * @param error Receives INVALID_FILE_ID if the id does not fit
     * @return Encoded frame, or empty vector on failure
     */
    static std::vector<uint8_t> encode(const std::string& file_id, uint32_t chunk_index,
                                       const uint8_t* data, size_t size,
                                       XtransError* error = nullptr);

    static std::vector<uint8_t> encode(const std::string& file_id, uint32_t chunk_index,
                                       const std::vector<uint8_t>& payload,
                                       XtransError* error = nullptr);

    /**
     * Decode a chunk frame.
     * @return Frame, or nullopt if the buffer is shorter than the header or the magic does not match
     */
    static std::optional<ChunkFrame> decode(const uint8_t* data, size_t length);

    static std::optional<ChunkFrame> decode(const std::vector<uint8_t>& data);

    /**
     * Check the magic without decoding the frame.
     */
    static bool is_chunk_frame(const uint8_t* data, size_t length);
};

} // namespace xtrans
