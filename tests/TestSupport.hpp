// Shared helpers for the framework-free test executables (run via CTest).
#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include <unistd.h>

namespace prosftp_test {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos,
              msg + " (got: '" + haystack + "')");
    }

    int finish(const char *name) const {
        if (failures != 0) {
            std::cerr << "[FAILURES] " << failures << "\n";
            return EXIT_FAILURE;
        }
        std::cout << "[OK] " << name << "\n";
        return EXIT_SUCCESS;
    }
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string &tag) {
        namespace fs = std::filesystem;
        static int counter = 0;
        path_ = fs::temp_directory_path() /
                ("prosftp-test-" + tag + "-" + std::to_string(::getpid()) +
                 "-" + std::to_string(++counter));
        std::error_code ec;
        fs::remove_all(path_, ec);
        fs::create_directories(path_, ec);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }
    std::string str() const { return path_.string(); }
    std::filesystem::path operator/(const std::string &rel) const {
        return path_ / rel;
    }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path &p, const std::string &data) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << data;
}

inline std::string readFile(const std::filesystem::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

inline std::string patterned(std::size_t n, unsigned seed = 1) {
    std::string s(n, '\0');
    unsigned x = seed;
    for (std::size_t i = 0; i < n; ++i) {
        x = x * 1103515245u + 12345u;
        s[i] = static_cast<char>((x >> 16) & 0xff);
    }
    return s;
}

} // namespace prosftp_test
