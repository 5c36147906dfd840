#include <parabox/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstdio>
#include <sstream>
#include <iomanip>
#include <random>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <time.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace parabox {

// ============ Time utilities ============

void sleep_ms(int milliseconds) {
    if (milliseconds <= 0) return;
    usleep(static_cast<useconds_t>(milliseconds) * 1000);
}

int64_t monotonic_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

size_t utf8_length(const std::string& s) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string utf8_truncate(const std::string& s, size_t max_chars) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (count == max_chars) {
                return s.substr(0, i);
            }
            ++count;
        }
    }
    return s;
}

std::string clip_text(const std::string& text, size_t max_chars) {
    std::string t = trim(text);
    if (utf8_length(t) <= max_chars) return t;
    return utf8_truncate(t, max_chars);
}

bool is_hex(const std::string& s) {
    if (s.empty()) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// ============ Path utilities ============

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0]) return std::string(home);
    return "";
}

std::string resolve_user_path(const std::string& path) {
    std::string trimmed = trim(path);
    if (trimmed.empty()) return trimmed;

    if (trimmed[0] == '~') {
        std::string home = get_home_dir();
        if (trimmed.size() == 1) {
            return home;
        }
        if (trimmed[1] == '/') {
            return home + trimmed.substr(1);
        }
    }

    return trimmed;
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_ends_slash = a[a.size() - 1] == '/';
    bool b_starts_slash = b[0] == '/';

    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

std::string dirname(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

bool path_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool is_regular_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode);
}

bool mkdir_p(const std::string& path) {
    if (path.empty()) return false;

    std::vector<std::string> parts = split(path, '/');
    std::string current;

    if (path[0] == '/') {
        current = "/";
    }

    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty()) continue;
        current = join_path(current, parts[i]);

        struct stat st;
        if (stat(current.c_str(), &st) != 0) {
            if (mkdir(current.c_str(), 0700) != 0 && errno != EEXIST) {
                return false;
            }
        } else if (!S_ISDIR(st.st_mode)) {
            return false;
        }
    }

    return true;
}

std::string executable_dir() {
    char buf[4096];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return "";
    buf[n] = '\0';
    return dirname(std::string(buf));
}

// ============ File utilities ============

bool read_file(const std::string& path, std::string& out) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;

    std::string content;
    char buffer[8192];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return false;
        }
        if (n == 0) break;
        content.append(buffer, static_cast<size_t>(n));
    }
    close(fd);
    out.swap(content);
    return true;
}

bool write_file_atomic(const std::string& path, const std::string& data) {
    std::ostringstream tmp_name;
    tmp_name << path << ".tmp-" << getpid();
    std::string tmp = tmp_name.str();

    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) return false;

    size_t written = 0;
    while (written < data.size()) {
        ssize_t rc = write(fd, data.data() + written, data.size() - written);
        if (rc < 0) {
            if (errno == EINTR) continue;
            close(fd);
            unlink(tmp.c_str());
            return false;
        }
        written += static_cast<size_t>(rc);
    }

    if (fsync(fd) != 0) {
        close(fd);
        unlink(tmp.c_str());
        return false;
    }
    close(fd);

    if (rename(tmp.c_str(), path.c_str()) != 0) {
        unlink(tmp.c_str());
        return false;
    }
    return true;
}

// ============ Identifiers and hashing ============

std::string generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, 16) != 1) {
        std::random_device rd;
        for (int i = 0; i < 16; ++i) {
            bytes[i] = static_cast<unsigned char>(rd() & 0xFF);
        }
    }

    // Set version 4
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    // Set variant
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return oss.str();
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), NULL) != 1) {
        return "";
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

} // namespace parabox
