#pragma once

/**
 * @file signaling_codec.h
 * @brief Short transferable codes for session descriptions
 *
 * Code formats:
 * - "X1:" + base64url(deflate(prune(description)))   current, produced by compress()
 * - "XTRANS:" + base64(description)                    legacy, decode-only
 * - "{...}"                                            raw JSON, decode-only passthrough
 *
 * Pruning keeps the first two host candidates, every server-reflexive and
 * relay candidate, drops all other candidate types and leaves every
 * non-candidate line untouched.
 */

#include "errors.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace xtrans {

/**
 * Size statistics for a produced code (debugging aid)
 */
struct CompressionStats {
    size_t original_size;
    size_t compressed_size;
    double compression_ratio;   // Percent saved, may be negative for tiny inputs

    CompressionStats() : original_size(0), compressed_size(0), compression_ratio(0.0) {}
};

class SignalingCodec {
public:
    static constexpr const char* VERSION_PREFIX = "X1:";
    static constexpr const char* LEGACY_PREFIX = "XTRANS:";

    // Host candidates kept by prune()
    static constexpr int MAX_HOST_CANDIDATES = 2;

    // Upper bound for an inflated description
    static constexpr size_t MAX_DESCRIPTION_SIZE = 1024 * 1024;

    /**
     * Prune and compress a session description into a versioned code.
     * @param description SDP text or a {"type","sdp"} JSON description
     * @param error Optional error output
     * @return Code, or empty string if compression failed
     */
    static std::string compress(const std::string& description, XtransError* error = nullptr);

    /**
     * Decode a code in any of the recognised formats.
     * @param code Code produced by compress(), a legacy code, or raw JSON
     * @param error Receives DECODE_ERROR on failure
     * @return Session description, or nullopt if the code is malformed
     */
    static std::optional<std::string> decompress(const std::string& code, XtransError* error = nullptr);

    /**
     * @return true if the code carries the current version tag
     */
    static bool is_compressed(const std::string& code);

    /**
     * Candidate pruning applied by compress().
     * JSON descriptions have their "sdp" field pruned; anything else is pruned as SDP text.
     */
    static std::string prune(const std::string& description);

    /**
     * Line-oriented pruning of SDP text. Line terminators are preserved.
     */
    static std::string prune_sdp(const std::string& sdp);

    static CompressionStats get_compression_stats(const std::string& original, const std::string& code);

    static std::string encode_base64(const std::vector<uint8_t>& data, bool url_safe);
    static bool decode_base64(const std::string& text, bool url_safe, std::vector<uint8_t>& out);

private:
    static bool deflate_bytes(const std::string& input, std::vector<uint8_t>& out, std::string& reason);
    static bool inflate_bytes(const std::vector<uint8_t>& input, std::string& out, std::string& reason);
    static std::string candidate_type(const std::string& line);
};

} // namespace xtrans
