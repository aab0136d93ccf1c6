#pragma once

#include "core/types.hpp"

#include <cstdint>

namespace flbkinesis {

/**
 * @brief Delivery collaborator driven by the flush dispatcher
 *
 * The dispatcher creates one RequestBuffer per flush attempt and feeds
 * records in order through add_record(), then calls flush() once.
 * Implementations must tolerate concurrent calls with distinct buffers.
 */
class IDeliveryAdapter {
public:
    virtual ~IDeliveryAdapter() = default;

    /// Convert one record into a request entry (may send a full batch early)
    [[nodiscard]] virtual FlushOutcome add_record(RequestBuffer& buffer,
                                                  const nlohmann::json& record,
                                                  Timestamp timestamp) = 0;

    /**
     * @brief Send whatever remains in the buffer
     *
     * On RETRY the buffer holds the entries still to be sent, for callers
     * that retry with the same buffer. The flush dispatcher does not: it
     * rebuilds the whole batch on every attempt, so entries accepted by an
     * earlier attempt are sent again.
     */
    [[nodiscard]] virtual FlushOutcome flush(RequestBuffer& buffer) = 0;

    [[nodiscard]] virtual uint32_t plugin_id() const = 0;
};

} // namespace flbkinesis
