#pragma once

#include <string>
#include <utility>
#include <vector>

namespace oauth2_loopback {

/**
 * Error Context Helper
 *
 * Collects key/value details for an error message. Entries keep the order
 * in which they were set, so candidate lists read the way they were tried.
 *
 * Usage:
 *   ErrorContext ctx;
 *   ctx.Set("127.0.0.1:8000", "Address already in use")
 *      .Set("127.0.0.1:8001", "Address already in use");
 *   throw AllAddressesUnavailable(ctx.Format("no available port"), ...);
 */
class ErrorContext {
public:
    ErrorContext() = default;

    /**
     * Set a context variable. Setting an existing key replaces its value
     * in place.
     *
     * @return Reference to this context (for chaining)
     */
    ErrorContext& Set(const std::string& key, const std::string& value);

    /**
     * @return The context value, or empty string if not set
     */
    std::string Get(const std::string& key) const;

    /**
     * Build a formatted error message with context
     *
     * Example:
     *   ctx.Set("cert_file", "a.pem").Set("key_file", "");
     *   ctx.Format("TLS key missing");
     *   // Returns: "TLS key missing [cert_file: a.pem, key_file: ]"
     */
    std::string Format(const std::string& base_message) const;

    void Clear();

    bool IsEmpty() const;

    size_t Size() const { return entries_.size(); }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

} // namespace oauth2_loopback
