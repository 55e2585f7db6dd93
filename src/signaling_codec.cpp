#include "signaling_codec.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <zlib.h>
#include <sstream>
#include <cstring>

// Signaling codec logging macros
#define LOG_CODEC_DEBUG(message) LOG_DEBUG("codec", message)
#define LOG_CODEC_INFO(message)  LOG_INFO("codec", message)
#define LOG_CODEC_WARN(message)  LOG_WARN("codec", message)
#define LOG_CODEC_ERROR(message) LOG_ERROR("codec", message)

namespace xtrans {

namespace {

const char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
const char BASE64_URL_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

//=============================================================================
// Pruning
//=============================================================================

std::string SignalingCodec::candidate_type(const std::string& line) {
    // a=candidate:<foundation> <component> <transport> <priority> <ip> <port> typ <type> ...
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        if (token == "typ") {
            std::string type;
            iss >> type;
            return type;
        }
    }
    return "";
}

std::string SignalingCodec::prune_sdp(const std::string& sdp) {
    std::string result;
    result.reserve(sdp.size());

    int host_count = 0;
    size_t pos = 0;
    bool first = true;

    while (pos <= sdp.size()) {
        size_t next = sdp.find('\n', pos);
        std::string line = sdp.substr(pos, next == std::string::npos ? std::string::npos : next - pos);

        bool keep = true;
        if (starts_with(line, "a=candidate:")) {
            std::string type = candidate_type(line);
            if (type == "host") {
                host_count++;
                keep = host_count <= MAX_HOST_CANDIDATES;
            } else {
                keep = (type == "srflx" || type == "relay");
            }
        }

        if (keep) {
            if (!first) {
                result.push_back('\n');
            }
            result += line;
            first = false;
        }

        if (next == std::string::npos) {
            break;
        }
        pos = next + 1;
    }

    return result;
}

std::string SignalingCodec::prune(const std::string& description) {
    std::string trimmed = trim(description);
    if (!trimmed.empty() && trimmed[0] == '{') {
        try {
            nlohmann::json json = nlohmann::json::parse(trimmed);
            if (json.is_object() && json.contains("sdp") && json["sdp"].is_string()) {
                json["sdp"] = prune_sdp(json["sdp"].get<std::string>());
                return json.dump();
            }
        } catch (const nlohmann::json::exception& e) {
            LOG_CODEC_DEBUG("Description is not JSON, pruning as SDP text: " << e.what());
        }
    }
    return prune_sdp(description);
}

//=============================================================================
// zlib
//=============================================================================

bool SignalingCodec::deflate_bytes(const std::string& input, std::vector<uint8_t>& out, std::string& reason) {
    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    out.resize(bound);

    int rc = compress2(out.data(), &bound,
                       reinterpret_cast<const Bytef*>(input.data()),
                       static_cast<uLong>(input.size()),
                       Z_BEST_COMPRESSION);
    if (rc != Z_OK) {
        reason = "deflate failed with zlib code " + std::to_string(rc);
        out.clear();
        return false;
    }

    out.resize(bound);
    return true;
}

bool SignalingCodec::inflate_bytes(const std::vector<uint8_t>& input, std::string& out, std::string& reason) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));

    if (inflateInit(&stream) != Z_OK) {
        reason = "inflateInit failed";
        return false;
    }

    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());

    out.clear();
    uint8_t buffer[16384];
    int rc = Z_OK;

    while (rc != Z_STREAM_END) {
        stream.next_out = buffer;
        stream.avail_out = sizeof(buffer);

        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            reason = stream.msg ? stream.msg : ("inflate failed with zlib code " + std::to_string(rc));
            inflateEnd(&stream);
            return false;
        }

        size_t produced = sizeof(buffer) - stream.avail_out;
        out.append(reinterpret_cast<const char*>(buffer), produced);

        if (out.size() > MAX_DESCRIPTION_SIZE) {
            reason = "inflated description exceeds size limit";
            inflateEnd(&stream);
            return false;
        }

        if (rc == Z_OK && produced == 0 && stream.avail_in == 0) {
            reason = "truncated compressed payload";
            inflateEnd(&stream);
            return false;
        }
    }

    inflateEnd(&stream);
    return true;
}

//=============================================================================
// Base64
//=============================================================================

std::string SignalingCodec::encode_base64(const std::vector<uint8_t>& data, bool url_safe) {
    const char* alphabet = url_safe ? BASE64_URL_CHARS : BASE64_CHARS;

    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    uint32_t val = 0;
    int valb = -6;
    for (uint8_t c : data) {
        val = (val << 8) + c;
        valb += 8;
        while (valb >= 0) {
            result.push_back(alphabet[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        result.push_back(alphabet[((val << 8) >> (valb + 8)) & 0x3F]);
    }

    // URL-safe codes travel unpadded
    if (!url_safe) {
        while (result.size() % 4) {
            result.push_back('=');
        }
    }
    return result;
}

bool SignalingCodec::decode_base64(const std::string& text, bool url_safe, std::vector<uint8_t>& out) {
    const char* alphabet = url_safe ? BASE64_URL_CHARS : BASE64_CHARS;

    int table[256];
    for (int i = 0; i < 256; i++) table[i] = -1;
    for (int i = 0; i < 64; i++) table[static_cast<unsigned char>(alphabet[i])] = i;

    out.clear();
    out.reserve(text.size() * 3 / 4);

    uint32_t val = 0;
    int valb = -8;
    bool padding = false;
    for (unsigned char c : text) {
        if (c == '=') {
            padding = true;
            continue;
        }
        if (padding || table[c] == -1) {
            return false;
        }
        val = (val << 6) + static_cast<uint32_t>(table[c]);
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return true;
}

//=============================================================================
// Public API
//=============================================================================

std::string SignalingCodec::compress(const std::string& description, XtransError* error) {
    std::string pruned = prune(description);

    std::vector<uint8_t> deflated;
    std::string reason;
    if (!deflate_bytes(pruned, deflated, reason)) {
        LOG_CODEC_ERROR("Failed to compress session description: " << reason);
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, reason);
        return "";
    }

    std::string code = std::string(VERSION_PREFIX) + encode_base64(deflated, true);
    LOG_CODEC_DEBUG("Compressed description " << description.size() << " -> " << code.size() << " bytes");
    return code;
}

std::optional<std::string> SignalingCodec::decompress(const std::string& code, XtransError* error) {
    if (starts_with(code, VERSION_PREFIX)) {
        std::vector<uint8_t> deflated;
        if (!decode_base64(code.substr(std::strlen(VERSION_PREFIX)), true, deflated) || deflated.empty()) {
            LOG_CODEC_WARN("Invalid base64 payload in versioned code");
            set_error(error, XtransErrorCode::DECODE_ERROR, "invalid base64 payload");
            return std::nullopt;
        }

        std::string description;
        std::string reason;
        if (!inflate_bytes(deflated, description, reason)) {
            LOG_CODEC_WARN("Failed to inflate versioned code: " << reason);
            set_error(error, XtransErrorCode::DECODE_ERROR, reason);
            return std::nullopt;
        }
        return description;
    }

    if (starts_with(code, LEGACY_PREFIX)) {
        std::vector<uint8_t> bytes;
        if (!decode_base64(trim(code.substr(std::strlen(LEGACY_PREFIX))), false, bytes)) {
            LOG_CODEC_WARN("Invalid base64 payload in legacy code");
            set_error(error, XtransErrorCode::DECODE_ERROR, "invalid legacy payload");
            return std::nullopt;
        }
        return std::string(bytes.begin(), bytes.end());
    }

    std::string trimmed = trim(code);
    if (!trimmed.empty() && trimmed[0] == '{') {
        return trimmed;
    }

    LOG_CODEC_WARN("Unrecognised signaling code format");
    set_error(error, XtransErrorCode::DECODE_ERROR, "unrecognised code format");
    return std::nullopt;
}

bool SignalingCodec::is_compressed(const std::string& code) {
    return starts_with(code, VERSION_PREFIX);
}

CompressionStats SignalingCodec::get_compression_stats(const std::string& original, const std::string& code) {
    CompressionStats stats;
    stats.original_size = original.size();
    stats.compressed_size = code.size();
    if (stats.original_size > 0) {
        stats.compression_ratio = (1.0 - static_cast<double>(stats.compressed_size) / stats.original_size) * 100.0;
    }
    return stats;
}

} // namespace xtrans
