#pragma once

#include <string>
#include <functional>

// Opaque identity of one logical session. Minted once per Connection and
// never reused within the process; every command and notification carries it.
class ConnectionKey {
public:
    // Random 64-bit prefix plus a process-wide sequence number.
    static ConnectionKey generate();

    // Wraps an existing key string (used by transports echoing keys back).
    explicit ConnectionKey(std::string value) : value_(std::move(value)) {}

    const std::string& str() const { return value_; }
    bool empty() const { return value_.empty(); }

    bool operator==(const ConnectionKey& other) const { return value_ == other.value_; }
    bool operator!=(const ConnectionKey& other) const { return value_ != other.value_; }
    bool operator<(const ConnectionKey& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

namespace std {
template <>
struct hash<ConnectionKey> {
    size_t operator()(const ConnectionKey& key) const noexcept {
        return hash<string>()(key.str());
    }
};
} // namespace std
