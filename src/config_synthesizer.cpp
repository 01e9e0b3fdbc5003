#include "config_synthesizer.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <optional>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

static std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

static std::string unquote(std::string value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

static bool starts_with(const std::string& text, const char* prefix) {
    return text.compare(0, std::strlen(prefix), prefix) == 0;
}

// Splits into lines that keep their '\n' so kept text is reproduced exactly.
static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t newline = text.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, newline - start + 1));
        start = newline + 1;
    }
    return lines;
}

static bool ends_with_blank_line(const std::string& text) {
    return text == "\n" ||
           (text.size() >= 2 && text.compare(text.size() - 2, 2, "\n\n") == 0);
}

std::string rewriteClientConfig(const std::string& existing, const std::string& ssid,
                                const std::string& password) {
    std::string out;
    std::vector<std::string> block;
    std::optional<std::string> block_ssid;
    bool in_block = false;

    for (const std::string& line : split_lines(existing)) {
        std::string trimmed = trim(line);

        if (!in_block && starts_with(trimmed, "network={")) {
            in_block = true;
            block.assign(1, line);
            block_ssid.reset();
        } else if (in_block && trimmed == "}") {
            block.push_back(line);
            in_block = false;
            if (block_ssid != ssid) {
                for (const auto& kept : block) out += kept;
            }
        } else if (in_block) {
            block.push_back(line);
            if (!block_ssid && starts_with(trimmed, "ssid=")) {
                block_ssid = unquote(trim(trimmed.substr(5)));
            }
        } else {
            out += line;
        }
    }

    if (in_block) {
        if (block_ssid != ssid) {
            spdlog::debug("[ConfigSynth] Keeping unterminated network block");
            for (const auto& kept : block) out += kept;
        } else {
            spdlog::debug("[ConfigSynth] Dropping unterminated block for '{}'", ssid);
        }
    }

    if (!out.empty() && out.back() != '\n') {
        out += '\n';
    }
    if (!out.empty() && !ends_with_blank_line(out)) {
        out += '\n';
    }

    out += "network={\n";
    out += "    ssid=\"" + ssid + "\"\n";
    if (!password.empty()) {
        out += "    psk=\"" + password + "\"\n";
    } else {
        out += "    key_mgmt=NONE\n";
    }
    out += "    priority=1\n";
    out += "}\n";
    return out;
}

static bool read_existing(const std::string& path, std::string& contents) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            contents.clear();
            return true;
        }
        spdlog::error("[ConfigSynth] Cannot stat {}: {}", path, std::strerror(errno));
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::error("[ConfigSynth] Cannot read {}", path);
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    contents = buffer.str();
    return true;
}

static bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

bool ConfigSynthesizer::upsertClientBlock(const std::string& path, const std::string& ssid,
                                          const std::string& password) {
    std::string existing;
    if (!read_existing(path, existing)) {
        return false;
    }

    const std::string updated = rewriteClientConfig(existing, ssid, password);
    const std::string temp_path = path + ".tmp";

    int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                    S_IRUSR | S_IWUSR);
    if (fd < 0) {
        spdlog::error("[ConfigSynth] Cannot create {}: {}", temp_path, std::strerror(errno));
        return false;
    }

    bool ok = write_all(fd, updated) && ::fsync(fd) == 0;
    int write_errno = errno;
    if (::close(fd) != 0) {
        ok = false;
        write_errno = errno;
    }
    if (!ok) {
        spdlog::error("[ConfigSynth] Failed writing {}: {}", temp_path, std::strerror(write_errno));
        ::unlink(temp_path.c_str());
        return false;
    }

    if (::chmod(temp_path.c_str(), S_IRUSR | S_IWUSR) != 0) {
        spdlog::warn("[ConfigSynth] Could not restrict permissions on {}", temp_path);
    }

    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        spdlog::error("[ConfigSynth] Failed to replace {}: {}", path, std::strerror(errno));
        ::unlink(temp_path.c_str());
        return false;
    }

    spdlog::info("[ConfigSynth] Updated network block for '{}' in {}", ssid, path);
    return true;
}
