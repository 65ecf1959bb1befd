#include <drift/file_io.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace drift {

namespace fs = std::filesystem;

namespace {

std::string temp_sibling(const fs::path& path) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dis(0, 15);

    static const char hex_chars[] = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[dis(gen)];
    }
    return path.string() + ".tmp." + suffix;
}

void fsync_directory(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY);
    if (fd < 0) return;
    ::fsync(fd);
    ::close(fd);
}

} // namespace

Result<std::string> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return DriftError{DriftError::IO,
                "cannot stat " + path.string() + ": " + ec.message()};
        }
        return DriftError{DriftError::NotFound,
            "file not found: " + path.string()};
    }

    if (fs::is_directory(path, ec)) {
        return DriftError{DriftError::IO,
            "expected a file but found a directory: " + path.string()};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return DriftError{DriftError::IO,
            "cannot open file: " + path.string()};
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return DriftError{DriftError::IO,
            "read error: " + path.string()};
    }
    return Result<std::string>::ok(ss.str());
}

Status write_file_atomic(const fs::path& path, std::string_view content) {
    fs::path dir = path.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return DriftError{DriftError::IO,
                "cannot create directory " + dir.string() + ": " + ec.message()};
        }
    }

    std::string tmp = temp_sibling(path);
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return DriftError{DriftError::IO,
            "cannot create " + tmp + ": " + std::strerror(errno)};
    }

    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string reason = std::strerror(errno);
            ::close(fd);
            ::unlink(tmp.c_str());
            return DriftError{DriftError::IO,
                "cannot write " + path.string() + ": " + reason};
        }
        p += n;
        left -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        std::string reason = std::strerror(errno);
        ::close(fd);
        ::unlink(tmp.c_str());
        return DriftError{DriftError::IO,
            "cannot sync " + path.string() + ": " + reason};
    }
    ::close(fd);

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        ::unlink(tmp.c_str());
        return DriftError{DriftError::IO,
            "cannot replace " + path.string() + ": " + reason};
    }

    if (!dir.empty()) fsync_directory(dir);
    return ok_status();
}

std::string to_lf(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace drift
