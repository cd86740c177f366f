#ifndef TSDUMP_CORE_TYPES_H_
#define TSDUMP_CORE_TYPES_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tsdump {
namespace core {

/**
 * @brief Raw bytes of a row key, qualifier or value
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Unix timestamp, in seconds or milliseconds (see codec::in_milliseconds)
 */
using Timestamp = int64_t;

/**
 * @brief Resolved tags in row-key order
 */
using Tags = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief One stored column: a (qualifier, value) pair
 */
struct Column {
    Bytes qualifier;
    Bytes value;

    Column() = default;
    Column(Bytes q, Bytes v) : qualifier(std::move(q)), value(std::move(v)) {}

    bool operator==(const Column& other) const {
        return qualifier == other.qualifier && value == other.value;
    }
};

/**
 * @brief One stored row as delivered by a cursor
 */
struct Row {
    Bytes key;
    std::vector<Column> columns;
};

/**
 * @brief Formats bytes the way the dump shows them: "[0, -16, 42]"
 *
 * Bytes are printed as signed decimals.
 */
std::string bytes_to_string(const Bytes& bytes);

/**
 * @brief Lowercase hex without separators
 */
std::string to_hex(const Bytes& bytes);

/**
 * @brief Parses hex produced by to_hex (either case)
 * @throws InvalidArgumentError on odd length or a non-hex digit
 */
Bytes from_hex(const std::string& hex);

} // namespace core
} // namespace tsdump

#endif // TSDUMP_CORE_TYPES_H_
