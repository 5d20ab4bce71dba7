//
// Created by Sal Faris on 28/08/2026.
//

#include "asmd/log_classifier.hpp"
#include <algorithm>
#include <cctype>

namespace asmd {

    namespace {

        bool contains_ignore_case(std::string_view haystack, std::string_view needle) {
            auto it = std::search(haystack.begin(), haystack.end(),
                                  needle.begin(), needle.end(),
                                  [](char a, char b) {
                                      return std::tolower(static_cast<unsigned char>(a)) ==
                                             std::tolower(static_cast<unsigned char>(b));
                                  });
            return it != haystack.end();
        }

        std::optional<DeviceConnectionEvent> peer_event(std::string_view line, bool connected) {
            auto peer = parse_peer_token(line);
            if (!peer) {
                return std::nullopt;
            }
            return DeviceConnectionEvent{peer->first, connected};
        }

    } // namespace

    std::optional<std::pair<std::string, std::string>> parse_peer_token(std::string_view line) {
        const char* whitespace = " \t\r\n";

        size_t end = line.find_last_not_of(whitespace);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }

        size_t start = line.find_last_of(whitespace, end);
        start = (start == std::string_view::npos) ? 0 : start + 1;

        std::string_view token = line.substr(start, end - start + 1);

        size_t colon = token.rfind(':');
        if (colon == std::string_view::npos || colon == 0 || colon + 1 == token.size()) {
            return std::nullopt;
        }

        return std::make_pair(std::string(token.substr(0, colon)),
                              std::string(token.substr(colon + 1)));
    }

    std::optional<DeviceConnectionEvent> classify_stdout_line(std::string_view line) {
        if (line.find(ACCEPT_MARKER) != std::string_view::npos) {
            return peer_event(line, true);
        }
        if (line.find(CLOSE_MARKER) != std::string_view::npos) {
            return peer_event(line, false);
        }
        return std::nullopt;
    }

    std::optional<ProcessStopReason> classify_stderr_line(std::string_view line) {
        if (contains_ignore_case(line, BIND_FAILURE_MARKER)) {
            return ProcessStopReason::invalid_binding();
        }
        if (contains_ignore_case(line, INVALID_ARGUMENT_MARKER)) {
            return ProcessStopReason::invalid_argument();
        }
        return std::nullopt;
    }

} // namespace asmd
