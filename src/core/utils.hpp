#pragma once

#include <string>
#include <vector>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Make a string usable as a single file name on every supported platform.
// Path separators, reserved characters (<>:"/\|?*) and control characters
// become '_'; trailing dots/spaces are dropped (Windows rejects them).
// Returns "_" if nothing usable is left.
std::string sanitize_filename(const std::string& name);

// Join strings with a separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep);
