#pragma once

#include "core/types.hpp"
#include "ingest/batch_decoder.hpp"

#include <functional>

namespace flbkinesis {

/**
 * @brief Converts a host batch into an ordered NormalizedBatch
 *
 * Records are never dropped here: a null record, or one that fails the
 * JSON serialization probe, is kept in place and marked invalid.
 * Output order is host-submission order.
 */
class RecordNormalizer {
public:
    using Clock = std::function<Timestamp()>;

    RecordNormalizer();
    explicit RecordNormalizer(Clock clock);

    /**
     * @brief Drain the decoder into a NormalizedBatch
     *
     * Stops at END_OF_BATCH or MALFORMED; on MALFORMED, decode_failed is
     * set and the records decoded so far are returned.
     */
    [[nodiscard]] NormalizedBatch normalize(IBatchDecoder& decoder) const;

    /// Priority: event time > epoch seconds > clock(). Epoch seconds beyond
    /// the Timestamp range fall back to clock().
    [[nodiscard]] Timestamp resolve_timestamp(const HostTimestamp& ts) const;

    /**
     * @brief Validation probe: serialize to JSON and discard the result
     * @return true when the record serializes to a non-empty string
     */
    [[nodiscard]] static bool probe_serializable(const nlohmann::json& record, std::string& error);

private:
    Clock clock_;
};

} // namespace flbkinesis
