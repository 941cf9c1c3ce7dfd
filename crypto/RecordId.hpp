#pragma once

#include <initializer_list>
#include <string>

namespace fleetsense {

/**
 * @brief Deterministic record identifiers
 *
 * Events, trips and learned locations are keyed by a digest of their natural
 * key, so recomputing the same record yields the same id and a replayed
 * sample can never mint a second row.
 */
class RecordId {
public:
    // Lower-case hex SHA-256 of the input.
    static std::string sha256Hex(const std::string& data);

    // 32 hex characters derived from the '|'-joined parts, grouped 8-4-4-4-12.
    static std::string fromParts(std::initializer_list<std::string> parts);
};

} // namespace fleetsense
