#include "prosftp/RemotePath.hpp"

namespace prosftp {

std::string normalizeRemote(const std::string& path) {
    if (path.empty()) return "/";
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '\\') c = '/';
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::string joinRemote(const std::string& base, const std::string& name) {
    const std::string b = normalizeRemote(base);
    if (b.back() == '/') return b + name;
    return b + "/" + name;
}

std::string parentRemote(const std::string& path) {
    const std::string p = normalizeRemote(path);
    if (p == "/") return p;
    const auto slash = p.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return p.substr(0, slash);
}

std::string baseNameRemote(const std::string& path) {
    const std::string p = normalizeRemote(path);
    if (p == "/") return p;
    const auto slash = p.rfind('/');
    if (slash == std::string::npos) return p;
    return p.substr(slash + 1);
}

bool isWithinRemote(const std::string& path, const std::string& root) {
    const std::string p = normalizeRemote(path);
    const std::string r = normalizeRemote(root);
    if (p == r) return true;
    if (r == "/") return p.front() == '/';
    return p.size() > r.size() && p.compare(0, r.size(), r) == 0 &&
           p[r.size()] == '/';
}

std::string shellQuote(const std::string& word) {
    std::string out;
    out.reserve(word.size() + 2);
    out.push_back('\'');
    for (char c : word) {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace prosftp
