#include "messages.h"
#include <chrono>
#include <random>
#include <iomanip>
#include <sstream>

namespace xtrans {

//=============================================================================
// ChannelMessage
//=============================================================================

ChannelMessage ChannelMessage::from_text(std::string text) {
    ChannelMessage message;
    message.binary = false;
    message.text = std::move(text);
    return message;
}

ChannelMessage ChannelMessage::from_binary(std::vector<uint8_t> bytes) {
    ChannelMessage message;
    message.binary = true;
    message.bytes = std::move(bytes);
    return message;
}

//=============================================================================
// DataMessage
//=============================================================================

const char* data_message_type_to_string(DataMessageType type) {
    switch (type) {
        case DataMessageType::METADATA: return "metadata";
        case DataMessageType::CHUNK: return "chunk";
        case DataMessageType::END: return "end";
        case DataMessageType::TEXT: return "text";
        case DataMessageType::ACK: return "ack";
        case DataMessageType::FILE_ACCEPT: return "file_accept";
        case DataMessageType::FILE_REJECT: return "file_reject";
        case DataMessageType::FILE_CANCEL: return "file_cancel";
        default: return "unknown";
    }
}

std::optional<DataMessageType> data_message_type_from_string(const std::string& name) {
    if (name == "metadata") return DataMessageType::METADATA;
    if (name == "chunk") return DataMessageType::CHUNK;
    if (name == "end") return DataMessageType::END;
    if (name == "text") return DataMessageType::TEXT;
    if (name == "ack") return DataMessageType::ACK;
    if (name == "file_accept") return DataMessageType::FILE_ACCEPT;
    if (name == "file_reject") return DataMessageType::FILE_REJECT;
    if (name == "file_cancel") return DataMessageType::FILE_CANCEL;
    return std::nullopt;
}

DataMessage DataMessage::make_metadata(const FileMetadata& metadata) {
    DataMessage message;
    message.type = DataMessageType::METADATA;
    message.file_id = metadata.file_id;
    message.metadata = metadata;
    return message;
}

DataMessage DataMessage::make_chunk(const std::string& file_id, uint32_t chunk_index, std::vector<uint8_t> data) {
    DataMessage message;
    message.type = DataMessageType::CHUNK;
    message.file_id = file_id;
    message.chunk_index = chunk_index;
    message.data = std::move(data);
    return message;
}

DataMessage DataMessage::make_end(const std::string& file_id) {
    DataMessage message;
    message.type = DataMessageType::END;
    message.file_id = file_id;
    return message;
}

DataMessage DataMessage::make_text(const std::string& message_id, const std::string& content, int64_t timestamp) {
    DataMessage message;
    message.type = DataMessageType::TEXT;
    message.message_id = message_id;
    message.content = content;
    message.timestamp = timestamp;
    return message;
}

DataMessage DataMessage::make_ack(const std::string& message_id) {
    DataMessage message;
    message.type = DataMessageType::ACK;
    message.message_id = message_id;
    return message;
}

DataMessage DataMessage::make_file_accept(const std::string& file_id) {
    DataMessage message;
    message.type = DataMessageType::FILE_ACCEPT;
    message.file_id = file_id;
    return message;
}

DataMessage DataMessage::make_file_reject(const std::string& file_id) {
    DataMessage message;
    message.type = DataMessageType::FILE_REJECT;
    message.file_id = file_id;
    return message;
}

DataMessage DataMessage::make_file_cancel(const std::string& file_id) {
    DataMessage message;
    message.type = DataMessageType::FILE_CANCEL;
    message.file_id = file_id;
    return message;
}

nlohmann::json DataMessage::to_json() const {
    nlohmann::json json;
    json["type"] = data_message_type_to_string(type);

    switch (type) {
        case DataMessageType::METADATA:
            json["fileId"] = metadata.file_id;
            json["name"] = metadata.name;
            json["size"] = metadata.size;
            json["fileType"] = metadata.mime_type;
            json["chunks"] = metadata.chunk_count;
            break;
        case DataMessageType::CHUNK:
            json["fileId"] = file_id;
            json["chunkIndex"] = chunk_index;
            break;
        case DataMessageType::TEXT:
            json["messageId"] = message_id;
            json["content"] = content;
            json["timestamp"] = timestamp;
            break;
        case DataMessageType::ACK:
            json["messageId"] = message_id;
            break;
        case DataMessageType::END:
        case DataMessageType::FILE_ACCEPT:
        case DataMessageType::FILE_REJECT:
        case DataMessageType::FILE_CANCEL:
            json["fileId"] = file_id;
            break;
    }

    return json;
}

std::optional<DataMessage> DataMessage::from_json(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("type") || !json["type"].is_string()) {
        return std::nullopt;
    }

    auto type = data_message_type_from_string(json["type"].get<std::string>());
    if (!type) {
        return std::nullopt;
    }

    DataMessage message;
    message.type = *type;

    try {
        switch (message.type) {
            case DataMessageType::METADATA:
                message.metadata.file_id = json.at("fileId").get<std::string>();
                message.metadata.name = json.value("name", "");
                message.metadata.size = json.value("size", static_cast<uint64_t>(0));
                message.metadata.mime_type = json.value("fileType", "");
                message.metadata.chunk_count = json.value("chunks", static_cast<uint32_t>(0));
                message.file_id = message.metadata.file_id;
                break;
            case DataMessageType::CHUNK:
                message.file_id = json.at("fileId").get<std::string>();
                message.chunk_index = json.value("chunkIndex", static_cast<uint32_t>(0));
                break;
            case DataMessageType::TEXT:
                message.message_id = json.value("messageId", "");
                message.content = json.value("content", "");
                message.timestamp = json.value("timestamp", static_cast<int64_t>(0));
                break;
            case DataMessageType::ACK:
                message.message_id = json.at("messageId").get<std::string>();
                break;
            case DataMessageType::END:
            case DataMessageType::FILE_ACCEPT:
            case DataMessageType::FILE_REJECT:
            case DataMessageType::FILE_CANCEL:
                message.file_id = json.at("fileId").get<std::string>();
                break;
        }
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }

    return message;
}

//=============================================================================
// P2PMessage
//=============================================================================

const char* p2p_message_kind_to_string(P2PMessageKind kind) {
    switch (kind) {
        case P2PMessageKind::TEXT: return "text";
        case P2PMessageKind::FILE: return "file";
        case P2PMessageKind::CONTROL: return "control";
        case P2PMessageKind::HANDSHAKE: return "handshake";
        default: return "file";
    }
}

std::optional<P2PMessageKind> p2p_message_kind_from_string(const std::string& name) {
    if (name == "text") return P2PMessageKind::TEXT;
    if (name == "file") return P2PMessageKind::FILE;
    if (name == "control") return P2PMessageKind::CONTROL;
    if (name == "handshake") return P2PMessageKind::HANDSHAKE;
    return std::nullopt;
}

P2PMessage P2PMessage::make(P2PMessageKind kind, nlohmann::json data) {
    P2PMessage message;
    message.kind = kind;
    message.data = std::move(data);
    message.timestamp = current_time_ms();
    message.id = generate_message_id();
    return message;
}

P2PMessage P2PMessage::make_file(std::shared_ptr<const FilePayload> file) {
    P2PMessage message = make(P2PMessageKind::FILE, nlohmann::json::object());
    if (file) {
        message.data["name"] = file->name;
        message.data["fileType"] = file->mime_type;
        message.data["size"] = file->data.size();
    }
    message.file = std::move(file);
    return message;
}

P2PMessage P2PMessage::from_inbound(const InboundMessage& inbound) {
    P2PMessage message;
    message.kind = inbound.kind;
    message.protocol = inbound.protocol;

    const nlohmann::json& json = inbound.json;
    if (json.is_object() && json.contains("data")) {
        message.data = json["data"];
    } else {
        message.data = json;
    }

    if (json.is_object() && json.contains("timestamp") && json["timestamp"].is_number_integer()) {
        message.timestamp = json["timestamp"].get<int64_t>();
    } else {
        message.timestamp = current_time_ms();
    }

    if (json.is_object() && json.contains("id") && json["id"].is_string()) {
        message.id = json["id"].get<std::string>();
    } else if (json.is_object() && json.contains("messageId") && json["messageId"].is_string()) {
        message.id = json["messageId"].get<std::string>();
    } else {
        message.id = generate_message_id();
    }
    return message;
}

nlohmann::json P2PMessage::to_json() const {
    nlohmann::json json;
    json["type"] = p2p_message_kind_to_string(kind);
    json["data"] = data;
    json["timestamp"] = timestamp;
    json["id"] = id;
    return json;
}

//=============================================================================
// Classification
//=============================================================================

InboundMessage parse_inbound_message(const ChannelMessage& message) {
    InboundMessage inbound;
    inbound.kind = P2PMessageKind::FILE;

    if (message.binary) {
        auto frame = PacketFramer::decode(message.bytes);
        if (frame) {
            inbound.protocol = DataMessage::make_chunk(frame->file_id, frame->chunk_index,
                                                       std::move(frame->payload));
        } else {
            // Unframed bytes: legacy chunk without a correlation id
            inbound.protocol = DataMessage::make_chunk("", 0, message.bytes);
        }
        return inbound;
    }

    nlohmann::json json = nlohmann::json::parse(message.text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return inbound;
    }

    std::string type;
    if (json.contains("type") && json["type"].is_string()) {
        type = json["type"].get<std::string>();
    }

    auto kind = p2p_message_kind_from_string(type);
    if (kind) {
        inbound.kind = *kind;
    }

    // Chunk-protocol tags ("text" is both an envelope kind and a protocol tag)
    auto protocol = DataMessage::from_json(json);
    if (protocol) {
        inbound.protocol = std::move(protocol);
    }

    inbound.json = std::move(json);
    return inbound;
}

P2PMessageKind classify_message(const ChannelMessage& message) {
    return parse_inbound_message(message).kind;
}

//=============================================================================
// Identifiers
//=============================================================================

namespace {

std::mt19937_64& random_engine() {
    thread_local std::mt19937_64 engine(std::random_device{}());
    return engine;
}

} // namespace

std::string generate_message_id() {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<int> dist(0, 35);

    std::string id;
    id.reserve(8);
    for (int i = 0; i < 8; ++i) {
        id.push_back(digits[dist(random_engine())]);
    }
    return id;
}

std::string generate_file_id() {
    std::uniform_int_distribution<uint32_t> dist(0, 255);
    uint8_t bytes[16];
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(dist(random_engine()));
    }

    // RFC 4122 version 4
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

int64_t current_time_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace xtrans
