#include "uuid.hpp"

namespace
{

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool is_dash_position(size_t i)
{
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

bool Uuid::parse(const std::string &text, Uuid &out)
{
    std::string body = text;
    const std::string urn = "urn:uuid:";

    if (body.size() == 36 + urn.size())
    {
        for (size_t i = 0; i < urn.size(); ++i)
        {
            char c = body[i];
            if (c >= 'A' && c <= 'Z')
                c = static_cast<char>(c - 'A' + 'a');
            if (c != urn[i])
                return false;
        }
        body = body.substr(urn.size());
    }
    else if (body.size() == 38)
    {
        if (body.front() != '{' || body.back() != '}')
            return false;
        body = body.substr(1, 36);
    }

    bool hyphenated;
    if (body.size() == 36)
        hyphenated = true;
    else if (body.size() == 32)
        hyphenated = false;
    else
        return false;

    std::array<uint8_t, 16> raw{};
    size_t digit = 0;
    for (size_t i = 0; i < body.size(); ++i)
    {
        if (hyphenated && is_dash_position(i))
        {
            if (body[i] != '-')
                return false;
            continue;
        }

        int value = hex_value(body[i]);
        if (value < 0)
            return false;
        if (digit % 2 == 0)
            raw[digit / 2] = static_cast<uint8_t>(value << 4);
        else
            raw[digit / 2] |= static_cast<uint8_t>(value);
        ++digit;
    }

    out = Uuid(raw);
    return true;
}

std::string Uuid::to_string() const
{
    static const char digits[] = "0123456789abcdef";

    std::string text;
    text.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            text.push_back('-');
        text.push_back(digits[bytes[i] >> 4]);
        text.push_back(digits[bytes[i] & 0x0f]);
    }
    return text;
}
