/**
 * @file log_classifier.hpp
 * @brief Classification of as-cmd output lines
 *
 * The worker reports accepted and closed client connections on stdout:
 *   [info] accept 10.0.0.5:4000
 *   [info] close 10.0.0.5:4000
 *
 * and fatal configuration problems on stderr:
 *   ... bind: Cannot assign requested address
 *   ... Invalid argument
 *
 * The functions here are pure; lines that do not match (or are malformed)
 * produce no event. The worker's log format is not a guaranteed contract,
 * so nothing here reports errors.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "asmd/process_stop_reason.hpp"

namespace asmd {

    inline constexpr std::string_view ACCEPT_MARKER = "[info] accept";
    inline constexpr std::string_view CLOSE_MARKER = "[info] close";
    inline constexpr std::string_view BIND_FAILURE_MARKER = "cannot assign requested address";
    inline constexpr std::string_view INVALID_ARGUMENT_MARKER = "invalid argument";

    /**
     * @brief Splits the trailing "ip:port" token of a line
     *
     * Takes the last whitespace-delimited token and splits it on the
     * last colon.
     *
     * @return (address, port) or std::nullopt if there is no token, no colon,
     *         or an empty address
     */
    std::optional<std::pair<std::string, std::string>> parse_peer_token(std::string_view line);

    /**
     * @brief Classifies a stdout line into a connect/disconnect event
     */
    std::optional<DeviceConnectionEvent> classify_stdout_line(std::string_view line);

    /**
     * @brief Classifies a stderr line into a terminal fault
     *
     * Fault markers are matched case-insensitively.
     *
     * @return InvalidBinding, InvalidArgument, or std::nullopt
     */
    std::optional<ProcessStopReason> classify_stderr_line(std::string_view line);

} // namespace asmd
