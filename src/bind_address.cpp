#include "bind_address.hpp"

namespace oauth2_loopback {

const std::regex BindAddress::IPV6_PATTERN("^\\[([0-9A-Za-z:.%]+)\\]:([0-9]{1,5})$");

const std::regex BindAddress::HOST_PORT_PATTERN("^([^:\\[\\]/\\s]*):([0-9]{1,5})$");

std::optional<BindAddress> BindAddress::Parse(const std::string& text) {
    std::smatch matches;
    BindAddress address;

    if (std::regex_match(text, matches, IPV6_PATTERN)) {
        address.host = matches[1];
    } else if (std::regex_match(text, matches, HOST_PORT_PATTERN)) {
        address.host = matches[1];
    } else {
        return std::nullopt;
    }

    int port = std::stoi(matches[2].str());
    if (port < 0 || port > 65535) {
        return std::nullopt;
    }
    address.port = port;
    return address;
}

std::string BindAddress::ToString() const {
    if (IsIPv6()) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

std::string BindAddress::UrlHost() const {
    if (IsWildcard()) {
        return "localhost";
    }
    if (IsIPv6()) {
        return "[" + host + "]";
    }
    return host;
}

bool BindAddress::IsWildcard() const {
    return host.empty() || host == "0.0.0.0" || host == "::";
}

bool BindAddress::IsIPv6() const {
    return host.find(':') != std::string::npos;
}

} // namespace oauth2_loopback
