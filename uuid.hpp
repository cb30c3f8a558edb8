#ifndef UUID_HPP
#define UUID_HPP

#include <array>
#include <cstdint>
#include <string>

// 16-byte identifier used by the relay for challenges and connections.
class Uuid
{
private:
    std::array<uint8_t, 16> bytes{};

public:
    Uuid() = default;
    explicit Uuid(const std::array<uint8_t, 16> &raw) : bytes(raw) {}

    // Accepts "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx", 32 bare hex digits,
    // and either of those wrapped in {} or prefixed with "urn:uuid:".
    static bool parse(const std::string &text, Uuid &out);

    std::string to_string() const;
    const std::array<uint8_t, 16> &data() const { return bytes; }

    bool operator==(const Uuid &other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid &other) const { return bytes != other.bytes; }
};

#endif
