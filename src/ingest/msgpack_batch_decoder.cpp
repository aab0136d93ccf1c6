#include "ingest/msgpack_batch_decoder.hpp"
#include "core/utils.hpp"

#include <format>

namespace flbkinesis {

namespace {

uint32_t read_be32(const std::vector<uint8_t>& bytes, size_t pos) {
    return (static_cast<uint32_t>(bytes[pos]) << 24) |
           (static_cast<uint32_t>(bytes[pos + 1]) << 16) |
           (static_cast<uint32_t>(bytes[pos + 2]) << 8) |
           static_cast<uint32_t>(bytes[pos + 3]);
}

} // anonymous namespace

MsgpackBatchDecoder::MsgpackBatchDecoder(const void* data, size_t length)
    : buffer_(static_cast<const char*>(data), data ? length : 0),
      stream_(&buffer_) {}

DecodeStatus MsgpackBatchDecoder::fail(std::string message) {
    failed_ = true;
    last_error_ = std::move(message);
    return DecodeStatus::MALFORMED;
}

HostTimestamp MsgpackBatchDecoder::resolve_time(const nlohmann::json& value) {
    if (value.is_binary()) {
        const auto& bin = value.get_binary();
        if (bin.has_subtype() && bin.subtype() == static_cast<uint8_t>(kEventTimeExtType) &&
            bin.size() == 8) {
            const auto seconds = read_be32(bin, 0);
            const auto nanos = read_be32(bin, 4);
            const auto tp = Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanos)));
            return HostTimestamp::from_event_time(tp);
        }
        return {};
    }

    if (value.is_number_unsigned()) {
        return HostTimestamp::from_epoch_seconds(value.get<uint64_t>());
    }

    // Fluent Bit 2.x: [[time, metadata], record]
    if (value.is_array() && !value.empty() && !value.front().is_array()) {
        return resolve_time(value.front());
    }

    return {};
}

DecodeStatus MsgpackBatchDecoder::next(DecodedEntry& out) {
    if (failed_) return DecodeStatus::MALFORMED;

    if (stream_.peek() == std::char_traits<char>::eof()) {
        return DecodeStatus::END_OF_BATCH;
    }

    const size_t entry_offset = offset();
    nlohmann::json entry;
    try {
        entry = nlohmann::json::from_msgpack(stream_, /*strict=*/false);
    } catch (const nlohmann::json::exception& e) {
        return fail(std::format("msgpack decode failed at offset {}: {}", entry_offset, e.what()));
    }

    if (!entry.is_array() || entry.size() < 2) {
        return fail(std::format("entry at offset {} is not a [time, record] array", entry_offset));
    }

    out.timestamp = resolve_time(entry[0]);

    auto& record = entry[1];
    if (record.is_object()) {
        out.record = std::move(record);
    } else {
        if (!record.is_null()) {
            utils::log::warn(std::format("decode: record at offset {} is a {}, not a map",
                                         entry_offset, record.type_name()));
        }
        out.record = nullptr;
    }
    return DecodeStatus::RECORD;
}

} // namespace flbkinesis
