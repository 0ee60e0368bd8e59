/**
 * @file time_utils.hpp
 * @brief UTC partition keys and ISO-8601 timestamp parsing.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "cloudcover/core/types.hpp"

namespace cloudcover::core {

/**
 * @brief Current wall-clock instant as a UTC epoch.
 */
[[nodiscard]] Epoch now_utc();

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian civil date.
 */
[[nodiscard]] int days_from_civil(int y, unsigned m, unsigned d);

/**
 * @brief Year, day-of-year (1-based) and hour of a UTC epoch.
 */
[[nodiscard]] PartitionKey partition_key(const Epoch& epoch);

/**
 * @brief Render a partition key as `YYYY/DDD/HH`.
 */
[[nodiscard]] std::string format_partition(const PartitionKey& key);

/**
 * @brief UTC hour (0-23) of an epoch.
 */
[[nodiscard]] int utc_hour(const Epoch& epoch);

/**
 * @brief Parse an ISO-8601 timestamp into a UTC epoch.
 *
 * Accepts `YYYY-MM-DD[(T| )HH[:MM[:SS[.fff]]]][Z|+HH[:MM]|-HH[:MM]]`. A trailing `Z` is read as
 * `+00:00`; a missing offset is taken as UTC. Returns `std::nullopt` on malformed input.
 */
[[nodiscard]] std::optional<Epoch> parse_iso8601_utc(std::string_view text);

/**
 * @brief Parse a command-line instant: an ISO-8601 timestamp or finite Unix seconds.
 * @return `std::nullopt` when `text` is neither, including trailing garbage after a number.
 */
[[nodiscard]] std::optional<Epoch> parse_epoch(const std::string& text);

}  // namespace cloudcover::core
