#pragma once

#include <string_view>

namespace constlint {

// One diagnostic variant a rule can emit. Rules declare these as static
// constants and pick one per finding; they are never built at runtime.
struct LintCode {
    std::string_view name;
    std::string_view problemMessage;
    std::string_view correctionMessage;
};

constexpr bool operator==(const LintCode &a, const LintCode &b) {
    return a.name == b.name && a.problemMessage == b.problemMessage &&
           a.correctionMessage == b.correctionMessage;
}

constexpr bool operator!=(const LintCode &a, const LintCode &b) {
    return !(a == b);
}

} // namespace constlint
