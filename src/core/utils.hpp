#pragma once

#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Random RFC 4122 version-4 UUID, lowercase hex.
std::string generate_uuid();

// Single-quote a string for a POSIX shell: abc'd -> 'abc'\''d'
std::string shell_quote(const std::string& s);

// Join a remote (POSIX) directory and a file name with exactly one '/'.
std::string remote_join(const std::string& dir, const std::string& name);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
