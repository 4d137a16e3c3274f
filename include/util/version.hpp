#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace updater {

// Semantic version. Accepts a leading 'v'; segments beyond the third are
// folded into the prerelease tag ("1.2.3.4" -> 1.2.3-4).
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;
    std::string build;

    static std::optional<Version> Parse(std::string_view raw);

    std::string ToString() const;
};

// Build metadata is ignored; a prerelease sorts before the release it precedes.
int CompareVersions(const Version& lhs, const Version& rhs);

class VersionComparator {
public:
    // Falls back to numeric dot-segment comparison when either side is not semver.
    static int Compare(const std::string& lhs, const std::string& rhs);
};

} // namespace updater
