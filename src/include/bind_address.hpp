#pragma once

#include <optional>
#include <regex>
#include <string>

namespace oauth2_loopback {

/**
 * Bind Address
 *
 * One "host:port" candidate for the local server. IPv6 literals are written
 * in brackets ("[::1]:8000"). Port 0 asks the OS for a free port.
 *
 * Usage:
 *   auto address = BindAddress::Parse("127.0.0.1:0");
 *   if (address) {
 *       auto host = address->host;  // "127.0.0.1"
 *   }
 */
struct BindAddress {
    std::string host;
    int port = 0;

    /**
     * Parse a "host:port" or "[v6]:port" address
     *
     * @return Optional containing the address, or empty if the text is not
     *         a valid address or the port is outside 0..65535
     */
    static std::optional<BindAddress> Parse(const std::string& text);

    /**
     * @return The textual form, e.g. "127.0.0.1:8000" or "[::1]:8000"
     */
    std::string ToString() const;

    /**
     * Host as it should appear in a URL. Wildcard hosts ("", "0.0.0.0",
     * "::") become "localhost" since a browser cannot connect to them.
     */
    std::string UrlHost() const;

    bool IsWildcard() const;
    bool IsIPv6() const;

    bool operator==(const BindAddress& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const BindAddress& other) const { return !(*this == other); }

private:
    static const std::regex IPV6_PATTERN;
    static const std::regex HOST_PORT_PATTERN;
};

} // namespace oauth2_loopback
