//
// Created by opencode on 07/09/2026.
//

#include "asmd/network_policy.hpp"
#include <array>
#include <cstdio>
#include <iostream>
#include <sys/wait.h>

namespace asmd {

    FirewallRulePolicy::FirewallRulePolicy()
        : runner_(&FirewallRulePolicy::run_command) {}

    FirewallRulePolicy::FirewallRulePolicy(CommandRunner runner)
        : runner_(std::move(runner)) {}

    bool FirewallRulePolicy::allows(const std::string& address, uint16_t port) {
        bool firewalld_ok = true;
        if (auto rules = runner_("firewall-cmd --list-rich-rules 2>/dev/null")) {
            firewalld_ok = firewalld_rules_allow(*rules, address, port);
        }

        bool ufw_ok = true;
        if (auto rules = runner_("ufw status numbered 2>/dev/null")) {
            ufw_ok = ufw_rules_allow(*rules, address, port);
        }

        if (!firewalld_ok || !ufw_ok) {
            std::cout << "[AsDaemon] Firewall rules do not allow " << address << ":" << port
                      << " (firewalld: " << (firewalld_ok ? "ok" : "blocked")
                      << ", ufw: " << (ufw_ok ? "ok" : "blocked") << ")" << std::endl;
        }

        return firewalld_ok && ufw_ok;
    }

    bool FirewallRulePolicy::firewalld_rules_allow(const std::string& rules,
                                                   const std::string& address, uint16_t port) {
        std::string prefix = "destination address=\"" + address + "\" port port=\"" +
                             std::to_string(port) + "\" protocol=";
        return rules.find(prefix + "\"tcp\"") != std::string::npos &&
               rules.find(prefix + "\"udp\"") != std::string::npos;
    }

    bool FirewallRulePolicy::ufw_rules_allow(const std::string& rules,
                                             const std::string& address, uint16_t port) {
        std::string rule = address + ":" + std::to_string(port) + " ALLOW";
        return rules.find(rule) != std::string::npos;
    }

    std::optional<std::string> FirewallRulePolicy::run_command(const std::string& command) {
        FILE* pipe = popen(command.c_str(), "r");
        if (!pipe) {
            return std::nullopt;
        }

        std::array<char, 256> buffer;
        std::string output;
        while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
            output += buffer.data();
        }

        int status = pclose(pipe);
        if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            // Tool missing (127) or refused to run
            return std::nullopt;
        }

        return output;
    }

} // namespace asmd
