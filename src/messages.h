#pragma once

/**
 * @file messages.h
 * @brief Wire messages carried over a peer channel
 *
 * Two layers share the channel:
 * - the chunk protocol (DataMessage): flat JSON objects with a "type" of
 *   metadata|chunk|end|text|ack|file_accept|file_reject|file_cancel, plus binary chunk frames
 * - the envelope (P2PMessage): {type: text|file|control|handshake, data, timestamp, id}
 */

#include "packet_framer.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>

namespace xtrans {

//=============================================================================
// Channel payload
//=============================================================================

/**
 * One message on a reliable ordered channel: UTF-8 text or raw bytes.
 */
struct ChannelMessage {
    bool binary;
    std::string text;
    std::vector<uint8_t> bytes;

    ChannelMessage() : binary(false) {}

    static ChannelMessage from_text(std::string text);
    static ChannelMessage from_binary(std::vector<uint8_t> bytes);

    size_t size() const { return binary ? bytes.size() : text.size(); }
};

//=============================================================================
// Chunk protocol
//=============================================================================

enum class DataMessageType {
    METADATA,
    CHUNK,
    END,
    TEXT,
    ACK,
    FILE_ACCEPT,
    FILE_REJECT,
    FILE_CANCEL
};

const char* data_message_type_to_string(DataMessageType type);
std::optional<DataMessageType> data_message_type_from_string(const std::string& name);

/**
 * Metadata announced before a file is transferred
 */
struct FileMetadata {
    std::string file_id;
    std::string name;
    uint64_t size;
    std::string mime_type;
    uint32_t chunk_count;

    FileMetadata() : size(0), chunk_count(0) {}
};

/**
 * Chunk protocol message. Which fields are meaningful depends on type:
 * METADATA uses metadata, CHUNK uses file_id/chunk_index/data,
 * END/FILE_ACCEPT/FILE_REJECT/FILE_CANCEL use file_id,
 * TEXT uses message_id/content/timestamp, ACK uses message_id.
 */
struct DataMessage {
    DataMessageType type;
    std::string file_id;
    FileMetadata metadata;
    uint32_t chunk_index;
    std::vector<uint8_t> data;
    std::string message_id;
    std::string content;
    int64_t timestamp;

    DataMessage() : type(DataMessageType::END), chunk_index(0), timestamp(0) {}

    static DataMessage make_metadata(const FileMetadata& metadata);
    static DataMessage make_chunk(const std::string& file_id, uint32_t chunk_index, std::vector<uint8_t> data);
    static DataMessage make_end(const std::string& file_id);
    static DataMessage make_text(const std::string& message_id, const std::string& content, int64_t timestamp);
    static DataMessage make_ack(const std::string& message_id);
    static DataMessage make_file_accept(const std::string& file_id);
    static DataMessage make_file_reject(const std::string& file_id);
    static DataMessage make_file_cancel(const std::string& file_id);

    /**
     * JSON form. Chunks travel as binary frames; their JSON form omits the bytes.
     */
    nlohmann::json to_json() const;

    /**
     * @return Message, or nullopt if "type" is missing, unknown or fields are malformed
     */
    static std::optional<DataMessage> from_json(const nlohmann::json& json);
};

//=============================================================================
// Envelope
//=============================================================================

enum class P2PMessageKind {
    TEXT,
    FILE,
    CONTROL,
    HANDSHAKE
};

const char* p2p_message_kind_to_string(P2PMessageKind kind);
std::optional<P2PMessageKind> p2p_message_kind_from_string(const std::string& name);

/**
 * In-memory file content handed to a send operation
 */
struct FilePayload {
    std::string name;
    std::string mime_type;
    std::vector<uint8_t> data;

    FilePayload() = default;
    FilePayload(const std::string& file_name, const std::string& type, std::vector<uint8_t> bytes)
        : name(file_name), mime_type(type), data(std::move(bytes)) {}
};

/**
 * Result of a completed receive session
 */
struct ReceivedFile {
    FileMetadata metadata;
    std::vector<uint8_t> data;
};

struct InboundMessage;

struct P2PMessage {
    P2PMessageKind kind;
    nlohmann::json data;                    // Text content, control/handshake body, or inbound JSON
    int64_t timestamp;
    std::string id;
    std::optional<DataMessage> protocol;    // Inbound chunk-protocol message, if recognised
    std::shared_ptr<const FilePayload> file; // Outbound FILE content

    P2PMessage() : kind(P2PMessageKind::FILE), timestamp(0) {}

    /**
     * Build an outbound envelope with a fresh id and the current time.
     */
    static P2PMessage make(P2PMessageKind kind, nlohmann::json data);
    static P2PMessage make_file(std::shared_ptr<const FilePayload> file);

    /**
     * Envelope view of a received payload. Envelope fields (data, timestamp, id)
     * are taken from the JSON when present; otherwise data is the whole JSON object.
     */
    static P2PMessage from_inbound(const InboundMessage& inbound);

    nlohmann::json to_json() const;
};

//=============================================================================
// Classification
//=============================================================================

/**
 * A raw channel payload after parsing and classification
 */
struct InboundMessage {
    P2PMessageKind kind;
    nlohmann::json json;                    // Parsed JSON, null for binary payloads
    std::optional<DataMessage> protocol;    // Chunk-protocol message, if any

    InboundMessage() : kind(P2PMessageKind::FILE) {}
};

/**
 * Parse and classify a raw payload:
 * 1. JSON with type text|file|control|handshake -> that kind
 * 2. JSON with a chunk-protocol type -> FILE
 * 3. binary chunk frame -> FILE (CHUNK message)
 * 4. anything else -> FILE; unframed binary becomes a CHUNK with an empty file id
 */
InboundMessage parse_inbound_message(const ChannelMessage& message);

P2PMessageKind classify_message(const ChannelMessage& message);

//=============================================================================
// Identifiers
//=============================================================================

/**
 * Short random base-36 id for text and envelope messages.
 */
std::string generate_message_id();

/**
 * Random UUID (36 characters), fits the frame file id field exactly.
 */
std::string generate_file_id();

int64_t current_time_ms();

} // namespace xtrans
