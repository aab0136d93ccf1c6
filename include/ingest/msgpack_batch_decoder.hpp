#pragma once

#include "ingest/batch_decoder.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <streambuf>
#include <string>

namespace flbkinesis {

/**
 * @brief Decoder for Fluent Bit msgpack chunks
 *
 * A chunk is a concatenation of msgpack arrays, one per event:
 *   [time, record]                  (Fluent Bit 1.x)
 *   [[time, metadata], record]      (Fluent Bit 2.x)
 *
 * time is either EventTime (ext type 0: be32 seconds, be32 nanoseconds)
 * or a positive integer of epoch seconds. Values are parsed one at a time
 * with nlohmann::json::from_msgpack over a non-owning stream, so the host
 * buffer is never copied.
 */
class MsgpackBatchDecoder : public IBatchDecoder {
public:
    MsgpackBatchDecoder(const void* data, size_t length);

    // Non-copyable (stream refers to buffer_)
    MsgpackBatchDecoder(const MsgpackBatchDecoder&) = delete;
    MsgpackBatchDecoder& operator=(const MsgpackBatchDecoder&) = delete;

    [[nodiscard]] DecodeStatus next(DecodedEntry& out) override;
    [[nodiscard]] std::string last_error() const override { return last_error_; }

    /// Bytes consumed so far
    [[nodiscard]] size_t offset() const { return buffer_.consumed(); }

    static constexpr int8_t kEventTimeExtType = 0;

    /**
     * @brief Interpret a decoded time element
     *
     * Exposed for tests; arrays are unwrapped one level for the 2.x layout.
     */
    [[nodiscard]] static HostTimestamp resolve_time(const nlohmann::json& value);

private:
    // Read-only streambuf over host memory
    class MemoryBuffer : public std::streambuf {
    public:
        MemoryBuffer(const char* data, size_t length) {
            char* begin = const_cast<char*>(data);
            setg(begin, begin, begin + length);
        }

        [[nodiscard]] size_t consumed() const {
            return static_cast<size_t>(gptr() - eback());
        }
    };

    DecodeStatus fail(std::string message);

    MemoryBuffer buffer_;
    std::istream stream_;
    std::string last_error_;
    bool failed_ = false;
};

} // namespace flbkinesis
