/**
 * @file network_policy.hpp
 * @brief Reachability pre-check consulted before spawning the worker
 *
 * Before the worker is started the supervisor may ask a NetworkPolicy
 * whether the host firewall admits traffic to the bind address/port.
 * A refusal ends the start attempt with FirewallBlocked.
 *
 * FirewallRulePolicy inspects firewalld rich rules and ufw rules. A
 * firewall tool that is not installed (or fails) does not block.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace asmd {

    class NetworkPolicy {
    public:
        virtual ~NetworkPolicy() = default;

        /**
         * @brief Whether inbound TCP and UDP traffic to address:port is permitted
         */
        virtual bool allows(const std::string& address, uint16_t port) = 0;
    };

    /**
     * @brief Policy backed by firewall-cmd and ufw rule listings
     *
     * Both tools must agree (logical AND). Each tool is queried through a
     * command runner so tests can feed canned output.
     */
    class FirewallRulePolicy : public NetworkPolicy {
    public:
        /**
         * @brief Runs a shell command, returns stdout or std::nullopt on failure
         */
        using CommandRunner = std::function<std::optional<std::string>(const std::string&)>;

        FirewallRulePolicy();
        explicit FirewallRulePolicy(CommandRunner runner);

        bool allows(const std::string& address, uint16_t port) override;

        /**
         * @brief firewalld check: needs both a tcp and a udp rich rule
         *
         * Rule format:
         *   destination address="<ip>" port port="<port>" protocol="tcp"
         */
        static bool firewalld_rules_allow(const std::string& rules,
                                          const std::string& address, uint16_t port);

        /**
         * @brief ufw check: needs "<ip>:<port> ALLOW" in `ufw status numbered`
         */
        static bool ufw_rules_allow(const std::string& rules,
                                    const std::string& address, uint16_t port);

        /**
         * @brief Default runner: popen(), non-zero exit status is a failure
         */
        static std::optional<std::string> run_command(const std::string& command);

    private:
        CommandRunner runner_;
    };

} // namespace asmd
