#include "utils.hpp"
#include "constants.hpp"
#include <openssl/evp.h>
#include <fmt/format.h>
#include <chrono>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string compute_file_md5(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open for hashing: " + path.string());
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialise MD5 digest");
    }

    std::vector<char> block(HASH_BLOCK_SIZE);
    while (in) {
        in.read(block.data(), static_cast<std::streamsize>(block.size()));
        std::streamsize n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), block.data(), static_cast<size_t>(n)) != 1) {
            throw std::runtime_error("MD5 update failed for " + path.string());
        }
    }
    if (in.bad()) {
        throw std::runtime_error("Read error while hashing " + path.string());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw std::runtime_error("MD5 finalise failed for " + path.string());
    }

    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return hex;
}

std::string remote_join(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string remote_basename(const std::string& path) {
    std::string p = remote_normalize(path);
    auto slash = p.find_last_of('/');
    if (slash == std::string::npos) return p;
    return p.substr(slash + 1);
}

std::string remote_normalize(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

bool remote_is_within(const std::string& path, const std::string& root) {
    std::string r = remote_normalize(root);
    if (r.empty() || r == "/") return true;
    std::string p = remote_normalize(path);
    return p == r || (p.size() > r.size() && p.compare(0, r.size(), r) == 0 && p[r.size()] == '/');
}
