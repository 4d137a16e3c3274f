#include "util/version.hpp"

#include <charconv>
#include <ranges>
#include <string_view>
#include <vector>

namespace updater {

namespace {

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\n' || s.front() == '\r'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' || s.back() == '\r'))
        s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> Split(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    for (auto&& part : s | std::views::split(sep)) {
        out.emplace_back(part.begin(), part.end());
    }
    return out;
}

bool ParseNumber(std::string_view sv, int& out) {
    if (sv.empty()) return false;
    const auto* end = sv.data() + sv.size();
    auto [ptr, ec] = std::from_chars(sv.data(), end, out);
    return ec == std::errc{} && ptr == end && out >= 0;
}

bool IsNumeric(std::string_view sv) {
    if (sv.empty()) return false;
    for (char c : sv) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

int ComparePrerelease(std::string_view lhs, std::string_view rhs) {
    if (lhs == rhs) return 0;
    if (lhs.empty()) return 1;
    if (rhs.empty()) return -1;

    const auto l = Split(lhs, '.');
    const auto r = Split(rhs, '.');
    for (size_t i = 0; i < l.size() && i < r.size(); ++i) {
        const bool ln = IsNumeric(l[i]);
        const bool rn = IsNumeric(r[i]);
        if (ln && rn) {
            int lv = 0;
            int rv = 0;
            std::from_chars(l[i].data(), l[i].data() + l[i].size(), lv);
            std::from_chars(r[i].data(), r[i].data() + r[i].size(), rv);
            if (lv != rv) return lv < rv ? -1 : 1;
            continue;
        }
        if (ln != rn) return ln ? -1 : 1;
        const int c = l[i].compare(r[i]);
        if (c != 0) return c < 0 ? -1 : 1;
    }
    if (l.size() == r.size()) return 0;
    return l.size() < r.size() ? -1 : 1;
}

} // namespace

std::optional<Version> Version::Parse(std::string_view raw) {
    std::string_view s = Trim(raw);
    if (!s.empty() && (s.front() == 'v' || s.front() == 'V')) s.remove_prefix(1);
    if (s.empty()) return std::nullopt;

    Version v;
    if (const auto plus = s.find('+'); plus != std::string_view::npos) {
        v.build = std::string(s.substr(plus + 1));
        s = s.substr(0, plus);
    }
    std::string_view pre;
    if (const auto dash = s.find('-'); dash != std::string_view::npos) {
        pre = s.substr(dash + 1);
        s = s.substr(0, dash);
        if (pre.empty()) return std::nullopt;
    }

    const auto segments = Split(s, '.');
    if (segments.empty()) return std::nullopt;

    int* fields[] = {&v.major, &v.minor, &v.patch};
    std::string extra;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i < 3) {
            if (!ParseNumber(segments[i], *fields[i])) return std::nullopt;
            continue;
        }
        if (!IsNumeric(segments[i])) return std::nullopt;
        if (!extra.empty()) extra += '.';
        extra += segments[i];
    }

    v.prerelease = extra;
    if (!pre.empty()) {
        if (!v.prerelease.empty()) v.prerelease += '.';
        v.prerelease += pre;
    }
    return v;
}

std::string Version::ToString() const {
    std::string out = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (!prerelease.empty()) out += "-" + prerelease;
    if (!build.empty()) out += "+" + build;
    return out;
}

int CompareVersions(const Version& lhs, const Version& rhs) {
    if (lhs.major != rhs.major) return lhs.major < rhs.major ? -1 : 1;
    if (lhs.minor != rhs.minor) return lhs.minor < rhs.minor ? -1 : 1;
    if (lhs.patch != rhs.patch) return lhs.patch < rhs.patch ? -1 : 1;
    return ComparePrerelease(lhs.prerelease, rhs.prerelease);
}

int VersionComparator::Compare(const std::string& lhs, const std::string& rhs) {
    if (lhs == rhs)
        return 0;

    const auto lv = Version::Parse(lhs);
    const auto rv = Version::Parse(rhs);
    if (lv && rv)
        return CompareVersions(*lv, *rv);

    auto lhs_parts = lhs | std::views::split('.') |
                     std::views::transform([](auto&& rng) { return std::string_view(rng); });
    auto rhs_parts = rhs | std::views::split('.') |
                     std::views::transform([](auto&& rng) { return std::string_view(rng); });

    auto it_lhs = lhs_parts.begin();
    auto it_rhs = rhs_parts.begin();

    while (it_lhs != lhs_parts.end() || it_rhs != rhs_parts.end()) {
        int lhs_val = 0;
        int rhs_val = 0;

        if (it_lhs != lhs_parts.end()) {
            auto sv = *it_lhs;
            std::from_chars(sv.data(), sv.data() + sv.size(), lhs_val);
            ++it_lhs;
        }

        if (it_rhs != rhs_parts.end()) {
            auto sv = *it_rhs;
            std::from_chars(sv.data(), sv.data() + sv.size(), rhs_val);
            ++it_rhs;
        }

        if (lhs_val > rhs_val)
            return 1;
        if (lhs_val < rhs_val)
            return -1;
    }

    return 0;
}

} // namespace updater
