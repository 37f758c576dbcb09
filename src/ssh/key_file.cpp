#include "key_file.hpp"
#include <core/errors.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <random>

// Fresh path under the temp dir; pid plus a random suffix
static fs::path unique_key_path() {
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^ static_cast<unsigned>(getpid()));
    std::uniform_int_distribution<int> dist(10000, 99999);
    fs::path p;
    do {
        p = fs::temp_directory_path() /
            ("sftpfetch_key_" + std::to_string(getpid()) + "_" + std::to_string(dist(rng)));
    } while (fs::exists(p));
    return p;
}

ScopedKeyFile::ScopedKeyFile(const std::string& key_material)
    : path_(unique_key_path()) {
    // Owner-only from creation
    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (fd < 0) {
        throw TransportError("Cannot create key file " + path_.string() + ": " + strerror(errno));
    }

    std::string content = key_material;
    if (content.empty() || content.back() != '\n') content += '\n';

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            std::error_code ec;
            fs::remove(path_, ec);
            throw TransportError("Cannot write key file: " + std::string(strerror(err)));
        }
        written += static_cast<size_t>(n);
    }
    ::close(fd);
}

ScopedKeyFile::~ScopedKeyFile() {
    std::error_code ec;
    fs::remove(path_, ec);
}
