#include "tsdump/query/query_parser.h"
#include "tsdump/core/error.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace tsdump {
namespace query {

namespace {

const std::vector<std::string> kAggregators = {
    "sum", "min", "max", "avg", "dev", "zimsum", "mimmin", "mimmax", "count"
};

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

int64_t unit_to_ms(const std::string& unit, const std::string& text) {
    if (unit == "ms") return 1;
    if (unit == "s") return 1000;
    if (unit == "m") return 60 * 1000LL;
    if (unit == "h") return 3600 * 1000LL;
    if (unit == "d") return 86400 * 1000LL;
    if (unit == "w") return 7 * 86400 * 1000LL;
    if (unit == "n") return 30 * 86400 * 1000LL;
    if (unit == "y") return 365 * 86400 * 1000LL;
    throw core::InvalidArgumentError("Invalid duration unit in: " + text);
}

core::Timestamp parse_absolute_date(const std::string& text) {
    static const char* kFormats[] = {
        "%Y/%m/%d-%H:%M:%S",
        "%Y/%m/%d-%H:%M",
        "%Y/%m/%d",
    };
    for (const char* format : kFormats) {
        std::tm tm{};
        std::istringstream in(text);
        in >> std::get_time(&tm, format);
        if (!in.fail() && in.peek() == std::char_traits<char>::eof()) {
            tm.tm_isdst = -1;
            std::time_t t = std::mktime(&tm);
            if (t == static_cast<std::time_t>(-1)) {
                break;
            }
            return static_cast<core::Timestamp>(t);
        }
    }
    throw core::InvalidArgumentError("Invalid date: " + text);
}

TagFilter parse_tag(const std::string& token) {
    auto eq = token.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == token.size()) {
        throw core::InvalidArgumentError("Invalid tag filter: " + token);
    }
    TagFilter filter;
    filter.tagk = token.substr(0, eq);
    std::string values = token.substr(eq + 1);
    if (values == "*") {
        return filter;
    }
    std::stringstream ss(values);
    std::string value;
    while (std::getline(ss, value, '|')) {
        if (value.empty()) {
            throw core::InvalidArgumentError("Empty tag value in: " + token);
        }
        filter.values.push_back(value);
    }
    return filter;
}

} // namespace

core::Timestamp parse_date(const std::string& text, core::Timestamp now_seconds) {
    if (all_digits(text)) {
        if (text.size() <= 10) {
            return std::stoll(text);
        }
        if (text.size() == 13) {
            return std::stoll(text);
        }
        throw core::InvalidArgumentError("Invalid timestamp: " + text);
    }
    const std::string suffix = "-ago";
    if (text.size() > suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0) {
        int64_t ms = parse_duration_ms(text.substr(0, text.size() - suffix.size()));
        return now_seconds - ms / 1000;
    }
    return parse_absolute_date(text);
}

int64_t parse_duration_ms(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    if (i == 0 || i == text.size()) {
        throw core::InvalidArgumentError("Invalid duration: " + text);
    }
    // 18 digits always fit in an int64_t.
    if (i > 18) {
        throw core::InvalidArgumentError("Duration out of range: " + text);
    }
    int64_t count = std::stoll(text.substr(0, i));
    if (count <= 0) {
        throw core::InvalidArgumentError("Duration must be positive: " + text);
    }
    int64_t unit = unit_to_ms(text.substr(i), text);
    if (count > std::numeric_limits<int64_t>::max() / unit) {
        throw core::InvalidArgumentError("Duration out of range: " + text);
    }
    return count * unit;
}

bool is_valid_aggregator(const std::string& name) {
    return std::find(kAggregators.begin(), kAggregators.end(), name) != kAggregators.end();
}

std::vector<Query> parse_query(const std::vector<std::string>& tokens, core::Timestamp now_seconds) {
    if (tokens.empty()) {
        throw core::InvalidArgumentError("Missing start date");
    }
    size_t i = 0;
    core::Timestamp start = parse_date(tokens[i++], now_seconds);
    core::Timestamp end = now_seconds;
    if (i < tokens.size() && !is_valid_aggregator(tokens[i])) {
        end = parse_date(tokens[i++], now_seconds);
    }

    std::vector<Query> queries;
    while (i < tokens.size()) {
        Query q;
        q.start = start;
        q.end = end;
        q.aggregator = tokens[i++];
        if (!is_valid_aggregator(q.aggregator)) {
            throw core::InvalidArgumentError("Invalid aggregator: " + q.aggregator);
        }
        if (i < tokens.size() && tokens[i] == "rate") {
            q.rate = true;
            ++i;
        }
        if (i < tokens.size() && tokens[i] == "downsample") {
            if (i + 2 >= tokens.size()) {
                throw core::InvalidArgumentError("downsample needs an interval and an aggregator");
            }
            Downsample ds;
            ds.interval_ms = parse_duration_ms(tokens[i + 1]);
            ds.aggregator = tokens[i + 2];
            if (!is_valid_aggregator(ds.aggregator)) {
                throw core::InvalidArgumentError("Invalid downsample aggregator: " + ds.aggregator);
            }
            q.downsample = ds;
            i += 3;
        }
        if (i >= tokens.size()) {
            throw core::InvalidArgumentError("Missing metric after aggregator " + q.aggregator);
        }
        q.metric = tokens[i++];
        if (q.metric.find('=') != std::string::npos) {
            throw core::InvalidArgumentError("Invalid metric name: " + q.metric);
        }
        while (i < tokens.size() && tokens[i].find('=') != std::string::npos) {
            q.filters.push_back(parse_tag(tokens[i++]));
        }
        queries.push_back(std::move(q));
    }

    if (queries.empty()) {
        throw core::InvalidArgumentError("No query given");
    }
    return queries;
}

std::vector<Query> parse_query(const std::vector<std::string>& tokens) {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return parse_query(tokens, static_cast<core::Timestamp>(now));
}

} // namespace query
} // namespace tsdump
