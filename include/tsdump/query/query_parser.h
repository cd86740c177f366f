#ifndef TSDUMP_QUERY_QUERY_PARSER_H_
#define TSDUMP_QUERY_QUERY_PARSER_H_

#include <string>
#include <vector>

#include "tsdump/core/types.h"
#include "tsdump/query/query.h"

namespace tsdump {
namespace query {

/**
 * @brief Parses a command-line date.
 *
 * Accepted forms: unix seconds, unix milliseconds (13 digits),
 * "yyyy/MM/dd", "yyyy/MM/dd-HH:mm", "yyyy/MM/dd-HH:mm:ss" (local time)
 * and relative "<n><unit>-ago" with unit one of s, m, h, d, w, n (30 days)
 * or y (365 days). Milliseconds input yields a millisecond timestamp,
 * everything else seconds.
 *
 * @throws InvalidArgumentError on anything else
 */
core::Timestamp parse_date(const std::string& text, core::Timestamp now_seconds);

/**
 * @brief Parses "<n><unit>" into milliseconds (units ms, s, m, h, d, w, n, y)
 * @throws InvalidArgumentError
 */
int64_t parse_duration_ms(const std::string& text);

bool is_valid_aggregator(const std::string& name);

/**
 * @brief Parses "START-DATE [END-DATE] query [query...]".
 *
 * Each query is "AGG [rate] [downsample INTERVAL AGG] METRIC [tagk=tagv ...]",
 * where a tag value may be "*" or alternatives separated by "|".
 * END-DATE defaults to now_seconds.
 *
 * @throws InvalidArgumentError on syntax errors or when no query is given
 */
std::vector<Query> parse_query(const std::vector<std::string>& tokens, core::Timestamp now_seconds);

/**
 * @brief Same as above, relative to the current wall clock
 */
std::vector<Query> parse_query(const std::vector<std::string>& tokens);

} // namespace query
} // namespace tsdump

#endif // TSDUMP_QUERY_QUERY_PARSER_H_
