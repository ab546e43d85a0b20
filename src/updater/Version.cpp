#include "Version.hpp"

#include <cctype>
#include <limits>

namespace updater
{

namespace
{

bool IsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// Accepts "1", "1.2", "1.2.3", "1.2.3.4", optionally followed by a pre-release
// tag or whitespace ("1.2.3-beta", "1.2.3\n")
bool ParseComponents(const std::string& text, std::array<int, 4>& out)
{
    std::size_t pos = 0;
    while (pos < text.size() && !IsDigit(text[pos]))
        ++pos;
    if (pos == text.size())
        return false;

    std::array<int, 4> parts{};
    std::size_t count = 0;
    while (true)
    {
        if (pos >= text.size() || !IsDigit(text[pos]))
            return false;

        long long value = 0;
        while (pos < text.size() && IsDigit(text[pos]))
        {
            value = value * 10 + (text[pos++] - '0');
            if (value > std::numeric_limits<int>::max())
                return false;
        }
        parts[count++] = static_cast<int>(value);

        if (pos == text.size())
            break;
        char next = text[pos];
        if (next == '.' && count < parts.size())
        {
            ++pos;
            continue;
        }
        if (next == '-' || next == '+' || std::isspace(static_cast<unsigned char>(next)))
            break;
        return false;
    }

    out = parts;
    return true;
}

} // namespace

Version::Version(const std::string& text)
{
    if (!ParseComponents(text, parts_))
        parts_ = {};
}

Version::Version(int major, int minor, int patch, int build)
    : parts_{ major, minor, patch, build }
{
}

std::string Version::toString() const
{
    std::string s = std::to_string(major()) + "." + std::to_string(minor()) + "." + std::to_string(patch());
    if (build() != 0)
        s += "." + std::to_string(build());
    return s;
}

bool Version::tryParse(const std::string& text, Version& outVersion)
{
    return ParseComponents(text, outVersion.parts_);
}

} // namespace updater
