#pragma once

#include <array>
#include <compare>
#include <string>

namespace updater
{

// Release version: major.minor.patch with an optional fourth build number.
// Missing components are zero, so "1.0" == "1.0.0" == "1.0.0.0".
class Version
{
public:
    // Any non-numeric prefix ("v", "release-") is skipped; an unparsable string yields 0.0.0
    explicit Version(const std::string& text);
    Version(int major, int minor, int patch, int build = 0);
    Version() = default;

    int major() const { return parts_[0]; }
    int minor() const { return parts_[1]; }
    int patch() const { return parts_[2]; }
    int build() const { return parts_[3]; }

    // "1.2.3", or "1.2.3.4" when the build number is set
    std::string toString() const;

    auto operator<=>(const Version& other) const = default;

    // Leaves outVersion untouched on failure
    static bool tryParse(const std::string& text, Version& outVersion);

private:
    std::array<int, 4> parts_{};
};

} // namespace updater
