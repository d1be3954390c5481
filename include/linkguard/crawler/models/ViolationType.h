#pragma once

#include <string>

// Outcome of checking a single link target
enum class Verdict {
    OK,
    BROKEN_LINK
};

// Kind of a page-to-link violation
enum class ViolationType {
    BROKEN_LINK,    // target answered >= 400, a disallowed redirect, or not at all
    CASCADE_LOGIN   // target matches a configured login-redirect pattern
};

inline std::string toString(Verdict verdict) {
    return verdict == Verdict::OK ? "ok" : "broken_link";
}

inline std::string toString(ViolationType type) {
    return type == ViolationType::CASCADE_LOGIN ? "cascade_login" : "broken_link";
}
