// Local tar.gz creation/extraction: ustar headers written through zlib's
// gzFile stream. Reads ustar, GNU long-name and pax archives.
#include "prosftp/ArchiveHelper.hpp"
#include "prosftp/Log.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <vector>

#include <sys/stat.h>
#include <sys/time.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace prosftp {
namespace archive {

namespace {

constexpr std::size_t kBlock = 512;
constexpr std::size_t kIoChunk = 64 * 1024;
constexpr std::uint64_t kMaxMetaRecord = 1024 * 1024; // L/K/x payloads

using Block = std::array<char, kBlock>;

// Header field offsets (POSIX ustar)
constexpr std::size_t kName = 0, kMode = 100, kUid = 108, kGid = 116, kSize = 124,
                      kMtime = 136, kChksum = 148, kType = 156, kLinkname = 157,
                      kMagic = 257, kVersion = 263, kPrefix = 345;

class GzHandle {
public:
    explicit GzHandle(gzFile f) : f_(f) {}
    ~GzHandle() {
        if (f_) gzclose(f_);
    }
    GzHandle(const GzHandle&) = delete;
    GzHandle& operator=(const GzHandle&) = delete;

    gzFile get() const { return f_; }
    int close() {
        const int rc = f_ ? gzclose(f_) : Z_OK;
        f_ = nullptr;
        return rc;
    }

private:
    gzFile f_;
};

std::string gzErrorText(gzFile f) {
    int code = 0;
    const char* msg = gzerror(f, &code);
    if (code == Z_ERRNO) return std::strerror(errno);
    return msg ? msg : "zlib error";
}

// width includes the trailing NUL; values too large for octal use the GNU
// base-256 encoding.
void putNumeric(char* field, std::size_t width, std::uint64_t value) {
    const std::size_t digits = width - 1;
    std::uint64_t limit = 1;
    for (std::size_t i = 0; i < digits; ++i) limit *= 8;
    if (value < limit) {
        std::snprintf(field, width, "%0*llo", static_cast<int>(digits),
                      static_cast<unsigned long long>(value));
        return;
    }
    std::memset(field, 0, width);
    field[0] = static_cast<char>(0x80);
    for (std::size_t i = width - 1; i > 0 && value; --i) {
        field[i] = static_cast<char>(value & 0xff);
        value >>= 8;
    }
}

std::uint64_t parseNumeric(const char* field, std::size_t width) {
    const auto* u = reinterpret_cast<const unsigned char*>(field);
    std::uint64_t v = 0;
    if (u[0] & 0x80) {
        v = u[0] & 0x7f;
        for (std::size_t i = 1; i < width; ++i) v = (v << 8) | u[i];
        return v;
    }
    std::size_t i = 0;
    while (i < width && (field[i] == ' ' || field[i] == '\0')) ++i;
    for (; i < width && field[i] >= '0' && field[i] <= '7'; ++i) v = v * 8 + static_cast<std::uint64_t>(field[i] - '0');
    return v;
}

std::string fieldString(const char* field, std::size_t width) {
    return std::string(field, strnlen(field, width));
}

unsigned headerChecksum(const Block& h) {
    unsigned sum = 0;
    for (std::size_t i = 0; i < kBlock; ++i) {
        if (i >= kChksum && i < kChksum + 8)
            sum += static_cast<unsigned>(' ');
        else
            sum += static_cast<unsigned char>(h[i]);
    }
    return sum;
}

// Some old writers summed signed chars.
int headerChecksumSigned(const Block& h) {
    int sum = 0;
    for (std::size_t i = 0; i < kBlock; ++i) {
        if (i >= kChksum && i < kChksum + 8)
            sum += ' ';
        else
            sum += static_cast<signed char>(h[i]);
    }
    return sum;
}

bool isZeroBlock(const Block& h) {
    return std::all_of(h.begin(), h.end(), [](char c) { return c == 0; });
}

// Splits a long name into ustar prefix (<=155) and name (<=100).
bool splitUstarName(const std::string& full, std::string& prefix, std::string& name) {
    if (full.size() > 256) return false;
    const std::size_t start = full.size() > 101 ? full.size() - 101 : 0;
    const std::size_t p = full.find('/', start);
    if (p == std::string::npos || p == 0 || p > 155) return false;
    const std::size_t restLen = full.size() - p - 1;
    if (restLen == 0 || restLen > 100) return false;
    prefix = full.substr(0, p);
    name = full.substr(p + 1);
    return true;
}

class TarWriter {
public:
    TarWriter(gzFile gz, SftpError& err) : gz_(gz), err_(err) {}

    bool writeRaw(const char* data, std::size_t len) {
        if (len == 0) return true;
        if (gzwrite(gz_, data, static_cast<unsigned>(len)) != static_cast<int>(len)) {
            err_.set(ErrorKind::LocalIOError, "Archive write failed: " + gzErrorText(gz_));
            return false;
        }
        return true;
    }

    bool pad(std::uint64_t written) {
        const std::size_t rem = static_cast<std::size_t>(written % kBlock);
        if (rem == 0) return true;
        static const Block zeros{};
        return writeRaw(zeros.data(), kBlock - rem);
    }

    bool entry(const std::string& name, char type, std::uint64_t size, std::uint32_t mode,
               std::uint64_t mtime, const std::string& link = {}) {
        std::string shortName = name;
        std::string prefix;
        if (name.size() > 100 && !splitUstarName(name, prefix, shortName)) {
            if (!longRecord('L', name)) return false;
            shortName = name.substr(0, 100);
            prefix.clear();
        }
        std::string shortLink = link;
        if (link.size() > 100) {
            if (!longRecord('K', link)) return false;
            shortLink = link.substr(0, 100);
        }

        Block h{};
        std::memcpy(&h[kName], shortName.data(), shortName.size());
        putNumeric(&h[kMode], 8, mode & 07777);
        putNumeric(&h[kUid], 8, 0);
        putNumeric(&h[kGid], 8, 0);
        putNumeric(&h[kSize], 12, size);
        putNumeric(&h[kMtime], 12, mtime);
        h[kType] = type;
        std::memcpy(&h[kLinkname], shortLink.data(), shortLink.size());
        std::memcpy(&h[kMagic], "ustar", 6);
        std::memcpy(&h[kVersion], "00", 2);
        std::memcpy(&h[kPrefix], prefix.data(), prefix.size());
        sealChecksum(h);
        return writeRaw(h.data(), kBlock);
    }

    bool fileData(const fs::path& path, std::uint64_t size) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            err_.set(ErrorKind::LocalIOError, "Could not read " + path.string() + " (" + std::strerror(errno) + ")");
            return false;
        }
        std::vector<char> buf(kIoChunk);
        std::uint64_t left = size;
        while (left > 0) {
            const std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(left, buf.size()));
            in.read(buf.data(), static_cast<std::streamsize>(want));
            if (static_cast<std::size_t>(in.gcount()) != want) {
                err_.set(ErrorKind::LocalIOError, "File changed while archiving: " + path.string());
                return false;
            }
            if (!writeRaw(buf.data(), want)) return false;
            left -= want;
        }
        return pad(size);
    }

    bool finish() {
        static const Block zeros{};
        return writeRaw(zeros.data(), kBlock) && writeRaw(zeros.data(), kBlock);
    }

private:
    gzFile gz_;
    SftpError& err_;

    static void sealChecksum(Block& h) {
        std::memset(&h[kChksum], ' ', 8);
        std::snprintf(&h[kChksum], 8, "%06o", headerChecksum(h));
        h[kChksum + 7] = ' ';
    }

    // GNU ././@LongLink record carrying a name that does not fit the header.
    bool longRecord(char type, const std::string& text) {
        Block h{};
        const char* marker = "././@LongLink";
        std::memcpy(&h[kName], marker, std::strlen(marker));
        putNumeric(&h[kMode], 8, 0644);
        putNumeric(&h[kUid], 8, 0);
        putNumeric(&h[kGid], 8, 0);
        putNumeric(&h[kSize], 12, text.size() + 1);
        putNumeric(&h[kMtime], 12, 0);
        h[kType] = type;
        std::memcpy(&h[kMagic], "ustar  ", 8); // old GNU magic
        sealChecksum(h);
        if (!writeRaw(h.data(), kBlock)) return false;
        if (!writeRaw(text.c_str(), text.size() + 1)) return false;
        return pad(text.size() + 1);
    }
};

class TarReader {
public:
    TarReader(gzFile gz, SftpError& err) : gz_(gz), err_(err) {}

    // false with empty err at a clean end of stream
    bool header(Block& h) {
        const int n = gzread(gz_, h.data(), kBlock);
        if (n == 0) return false;
        if (n < 0) {
            err_.set(ErrorKind::LocalIOError, "Archive read failed: " + gzErrorText(gz_));
            return false;
        }
        if (static_cast<std::size_t>(n) != kBlock) {
            err_.set(ErrorKind::LocalIOError, "Truncated archive");
            return false;
        }
        return true;
    }

    bool copy(std::uint64_t size, std::ostream* out) {
        std::vector<char> buf(kIoChunk);
        std::uint64_t padded = (size + kBlock - 1) / kBlock * kBlock;
        std::uint64_t left = size;
        while (padded > 0) {
            const std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(padded, buf.size()));
            const int n = gzread(gz_, buf.data(), static_cast<unsigned>(want));
            if (n < 0 || static_cast<std::size_t>(n) != want) {
                err_.set(ErrorKind::LocalIOError,
                         n < 0 ? "Archive read failed: " + gzErrorText(gz_) : std::string("Truncated archive"));
                return false;
            }
            const std::size_t useful = static_cast<std::size_t>(std::min<std::uint64_t>(left, want));
            if (out && useful > 0) {
                out->write(buf.data(), static_cast<std::streamsize>(useful));
                if (!*out) {
                    err_.set(ErrorKind::LocalIOError, std::string("Local write failed (") + std::strerror(errno) + ")");
                    return false;
                }
            }
            left -= useful;
            padded -= want;
        }
        return true;
    }

    bool text(std::uint64_t size, std::string& out) {
        if (size > kMaxMetaRecord) {
            err_.set(ErrorKind::LocalIOError, "Archive metadata record too large");
            return false;
        }
        std::ostringstream oss;
        if (!copy(size, &oss)) return false;
        out = oss.str();
        return true;
    }

private:
    gzFile gz_;
    SftpError& err_;
};

// "<len> key=value\n" records
void parsePax(const std::string& data, std::map<std::string, std::string>& out) {
    std::size_t pos = 0;
    while (pos < data.size()) {
        const std::size_t sp = data.find(' ', pos);
        if (sp == std::string::npos) break;
        const std::size_t len = static_cast<std::size_t>(std::strtoull(data.c_str() + pos, nullptr, 10));
        if (len == 0 || pos + len > data.size()) break;
        const std::string record = data.substr(sp + 1, pos + len - sp - 2); // drop '\n'
        const std::size_t eq = record.find('=');
        if (eq != std::string::npos) out[record.substr(0, eq)] = record.substr(eq + 1);
        pos += len;
    }
}

enum class PathCheck { Ok, Skip, Unsafe };

PathCheck safeRelative(const std::string& raw, fs::path& out) {
    std::string s = raw;
    while (s.compare(0, 2, "./") == 0) s.erase(0, 2);
    while (!s.empty() && s.back() == '/') s.pop_back();
    if (s.empty() || s == ".") return PathCheck::Skip;
    if (s.front() == '/') return PathCheck::Unsafe;
    const fs::path p(s);
    for (const auto& comp : p) {
        if (comp == "..") return PathCheck::Unsafe;
    }
    out = p.lexically_normal();
    return PathCheck::Ok;
}

bool parentHasSymlink(const fs::path& dest, const fs::path& rel) {
    fs::path partial = dest;
    std::error_code ec;
    for (const auto& comp : rel.parent_path()) {
        partial /= comp;
        if (fs::is_symlink(partial, ec)) return true;
    }
    return false;
}

void applyMeta(const fs::path& p, std::uint32_t mode, std::uint64_t mtime) {
    if (::chmod(p.c_str(), static_cast<mode_t>(mode & 0777)) != 0)
        PROSFTP_LOGD("chmod %s failed: %s", p.c_str(), std::strerror(errno));
    if (mtime == 0) return;
    struct timeval tv[2];
    tv[0].tv_sec = tv[1].tv_sec = static_cast<time_t>(mtime);
    tv[0].tv_usec = tv[1].tv_usec = 0;
    if (::utimes(p.c_str(), tv) != 0)
        PROSFTP_LOGD("utimes %s failed: %s", p.c_str(), std::strerror(errno));
}

} // namespace

bool createTarGz(const std::string& dirPath, const std::string& archivePath, SftpError& err) {
    std::error_code ec;
    fs::path root = fs::absolute(fs::path(dirPath), ec).lexically_normal();
    if (!root.has_filename()) root = root.parent_path();
    if (ec || !fs::is_directory(root, ec)) {
        err.set(ErrorKind::LocalIOError, "Not a directory: " + dirPath);
        return false;
    }
    const std::string base = root.filename().string();

    std::vector<fs::path> entries;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        err.set(ErrorKind::LocalIOError, "Could not walk " + root.string() + ": " + ec.message());
        return false;
    }
    std::sort(entries.begin(), entries.end());

    gzFile raw = gzopen(archivePath.c_str(), "wb6");
    if (!raw) {
        err.set(ErrorKind::LocalIOError, "Could not create archive " + archivePath + " (" + std::strerror(errno) + ")");
        return false;
    }
    GzHandle gz(raw);
    TarWriter w(gz.get(), err);

    bool ok = true;
    struct stat sb{};
    if (::lstat(root.c_str(), &sb) == 0) {
        ok = w.entry(base + "/", '5', 0, sb.st_mode, static_cast<std::uint64_t>(sb.st_mtime));
    } else {
        err.set(ErrorKind::LocalIOError, "Could not stat " + root.string());
        ok = false;
    }

    for (const auto& p : entries) {
        if (!ok) break;
        const std::string rel = base + "/" + p.lexically_relative(root).generic_string();
        if (::lstat(p.c_str(), &sb) != 0) {
            err.set(ErrorKind::LocalIOError, "Could not stat " + p.string() + " (" + std::strerror(errno) + ")");
            ok = false;
            break;
        }
        const auto mtime = static_cast<std::uint64_t>(sb.st_mtime);
        if (S_ISDIR(sb.st_mode)) {
            ok = w.entry(rel + "/", '5', 0, sb.st_mode, mtime);
        } else if (S_ISREG(sb.st_mode)) {
            const auto size = static_cast<std::uint64_t>(sb.st_size);
            ok = w.entry(rel, '0', size, sb.st_mode, mtime) && w.fileData(p, size);
        } else if (S_ISLNK(sb.st_mode)) {
            std::error_code lec;
            const fs::path target = fs::read_symlink(p, lec);
            if (lec) {
                err.set(ErrorKind::LocalIOError, "Could not read link " + p.string() + ": " + lec.message());
                ok = false;
            } else {
                ok = w.entry(rel, '2', 0, sb.st_mode, mtime, target.generic_string());
            }
        } else {
            PROSFTP_LOGW("Skipping special file %s", p.c_str());
        }
    }

    ok = ok && w.finish();
    const int rc = gz.close();
    if (ok && rc != Z_OK) {
        err.set(ErrorKind::LocalIOError, "Could not finish archive " + archivePath);
        ok = false;
    }
    if (!ok) {
        std::error_code rec;
        fs::remove(archivePath, rec);
    }
    return ok;
}

bool extractLocal(const std::string& archivePath, const std::string& destDir, SftpError& err) {
    std::error_code ec;
    const fs::path dest = fs::path(destDir);
    fs::create_directories(dest, ec);
    if (ec) {
        err.set(ErrorKind::LocalIOError, "Could not create " + destDir + ": " + ec.message());
        return false;
    }

    gzFile raw = gzopen(archivePath.c_str(), "rb");
    if (!raw) {
        err.set(ErrorKind::LocalIOError, "Could not open archive " + archivePath + " (" + std::strerror(errno) + ")");
        return false;
    }
    GzHandle gz(raw);
    TarReader r(gz.get(), err);

    struct DirMeta {
        fs::path path;
        std::uint32_t mode;
        std::uint64_t mtime;
    };
    std::vector<DirMeta> dirs;
    std::string longName;
    std::string longLink;
    std::map<std::string, std::string> pax;

    Block h{};
    while (r.header(h)) {
        if (isZeroBlock(h)) break; // end-of-archive marker

        const auto stored = static_cast<long long>(parseNumeric(&h[kChksum], 8));
        if (stored != static_cast<long long>(headerChecksum(h)) && stored != headerChecksumSigned(h)) {
            err.set(ErrorKind::LocalIOError, "Corrupt archive header in " + archivePath);
            return false;
        }

        const char type = h[kType];
        std::uint64_t size = parseNumeric(&h[kSize], 12);
        if (type == 'L' || type == 'K' || type == 'x') {
            std::string payload;
            if (!r.text(size, payload)) return false;
            if (type == 'x') {
                parsePax(payload, pax);
            } else {
                payload = payload.substr(0, strnlen(payload.c_str(), payload.size()));
                (type == 'L' ? longName : longLink) = payload;
            }
            continue;
        }
        if (type == 'g') {
            if (!r.copy(size, nullptr)) return false;
            continue;
        }

        std::string name;
        if (!longName.empty()) {
            name = longName;
        } else if (pax.count("path")) {
            name = pax["path"];
        } else {
            name = fieldString(&h[kName], 100);
            const std::string prefix = std::memcmp(&h[kMagic], "ustar\0", 6) == 0
                                           ? fieldString(&h[kPrefix], 155)
                                           : std::string();
            if (!prefix.empty()) name = prefix + "/" + name;
        }
        std::string link = !longLink.empty() ? longLink
                           : pax.count("linkpath") ? pax["linkpath"]
                                                   : fieldString(&h[kLinkname], 100);
        if (pax.count("size")) size = std::strtoull(pax["size"].c_str(), nullptr, 10);
        std::uint64_t mtime = parseNumeric(&h[kMtime], 12);
        if (pax.count("mtime")) mtime = std::strtoull(pax["mtime"].c_str(), nullptr, 10);
        const auto mode = static_cast<std::uint32_t>(parseNumeric(&h[kMode], 8));
        longName.clear();
        longLink.clear();
        pax.clear();

        fs::path rel;
        const PathCheck check = safeRelative(name, rel);
        if (check == PathCheck::Unsafe || (check == PathCheck::Ok && parentHasSymlink(dest, rel))) {
            err.set(ErrorKind::LocalIOError, "Unsafe path in archive: " + name);
            return false;
        }
        if (check == PathCheck::Skip) {
            if (!r.copy(size, nullptr)) return false;
            continue;
        }
        const fs::path target = dest / rel;

        switch (type) {
        case '5': {
            fs::create_directories(target, ec);
            if (ec) {
                err.set(ErrorKind::LocalIOError, "Could not create " + target.string() + ": " + ec.message());
                return false;
            }
            dirs.push_back({target, mode, mtime});
            if (!r.copy(size, nullptr)) return false;
            break;
        }
        case '0':
        case '\0':
        case '7': {
            fs::create_directories(target.parent_path(), ec);
            if (fs::is_symlink(target, ec)) fs::remove(target, ec);
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                err.set(ErrorKind::LocalIOError, "Could not write " + target.string() + " (" + std::strerror(errno) + ")");
                return false;
            }
            if (!r.copy(size, &out)) return false;
            out.close();
            if (!out) {
                err.set(ErrorKind::LocalIOError, "Could not finish " + target.string());
                return false;
            }
            applyMeta(target, mode, mtime);
            break;
        }
        case '1': {
            fs::path linkRel;
            std::error_code lec;
            // The link source must be a plain entry of this extraction.
            if (safeRelative(link, linkRel) != PathCheck::Ok || parentHasSymlink(dest, linkRel) ||
                fs::is_symlink(dest / linkRel, lec)) {
                err.set(ErrorKind::LocalIOError, "Unsafe hard link in archive: " + link);
                return false;
            }
            fs::create_directories(target.parent_path(), ec);
            if (fs::is_symlink(target, lec)) fs::remove(target, lec);
            fs::copy_file(dest / linkRel, target, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                err.set(ErrorKind::LocalIOError, "Could not materialize hard link " + name + ": " + ec.message());
                return false;
            }
            if (!r.copy(size, nullptr)) return false;
            break;
        }
        case '2': {
            fs::create_directories(target.parent_path(), ec);
            std::error_code rec;
            if (fs::is_symlink(target, rec) || fs::is_regular_file(target, rec)) fs::remove(target, rec);
            fs::create_symlink(fs::path(link), target, ec);
            if (ec) {
                err.set(ErrorKind::LocalIOError, "Could not create symlink " + target.string() + ": " + ec.message());
                return false;
            }
            if (!r.copy(size, nullptr)) return false;
            break;
        }
        default:
            PROSFTP_LOGW("Skipping unsupported archive entry '%c': %s", type, name.c_str());
            if (!r.copy(size, nullptr)) return false;
            break;
        }
    }
    if (!err.empty()) return false;

    // Deepest first so read-only parents do not block their children.
    for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) applyMeta(it->path, it->mode | 0700, it->mtime);

    if (gz.close() != Z_OK) {
        err.set(ErrorKind::LocalIOError, "Archive checksum/stream error in " + archivePath);
        return false;
    }
    return true;
}

} // namespace archive
} // namespace prosftp
