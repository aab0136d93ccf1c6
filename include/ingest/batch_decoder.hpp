#pragma once

#include "core/types.hpp"

#include <string>

namespace flbkinesis {

enum class DecodeStatus {
    RECORD,         ///< out was filled with the next entry
    END_OF_BATCH,   ///< clean end at an entry boundary
    MALFORMED       ///< bytes could not be decoded; no further entries
};

/**
 * @brief Pull-style decoder over one host batch
 *
 * End-of-batch and decode failure are distinct statuses; once MALFORMED
 * is returned every later call returns MALFORMED as well.
 */
class IBatchDecoder {
public:
    virtual ~IBatchDecoder() = default;

    [[nodiscard]] virtual DecodeStatus next(DecodedEntry& out) = 0;

    /// Description of the last MALFORMED condition (empty otherwise)
    [[nodiscard]] virtual std::string last_error() const = 0;
};

} // namespace flbkinesis
