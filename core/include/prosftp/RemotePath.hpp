// Remote (POSIX) path helpers. Remote paths always use '/' regardless of the
// local platform.
#pragma once
#include <string>

namespace prosftp {

// "" -> "/", '\' -> '/', repeated slashes collapsed, trailing slash removed
// (except for "/"). Does not resolve "." or "..".
std::string normalizeRemote(const std::string& path);

// normalizeRemote(base) + "/" + name
std::string joinRemote(const std::string& base, const std::string& name);

// Parent of a normalized path; "/" for top-level entries and for "/".
// Relative single-component paths have parent ".".
std::string parentRemote(const std::string& path);

// Last component; "/" for the root.
std::string baseNameRemote(const std::string& path);

// True if path equals root or lies below it (both normalized).
bool isWithinRemote(const std::string& path, const std::string& root);

// Single-quote a word for a POSIX shell: a'b -> 'a'\''b'
std::string shellQuote(const std::string& word);

} // namespace prosftp
