#include "wifi_settings.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

static std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

static bool parse_bool(const std::string& value, bool fallback) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return fallback;
}

std::vector<std::string> WifiSettings::privileged(std::vector<std::string> argv) const {
    if (use_sudo) {
        argv.insert(argv.begin(), "sudo");
    }
    return argv;
}

void loadSettingsFile(const std::string& path, WifiSettings& settings) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot read settings file " + path);
    }

    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            spdlog::warn("[Settings] {}:{}: expected key=value", path, line_number);
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "interface") {
            settings.interface = value;
        } else if (key == "ssid") {
            settings.ssid = value;
        } else if (key == "password") {
            settings.password = value;
        } else if (key == "hotspot_ssid") {
            settings.hotspot_ssid = value;
        } else if (key == "hotspot_password") {
            settings.hotspot_password = value;
        } else if (key == "hotspot_channel") {
            char* end = nullptr;
            errno = 0;
            long channel = std::strtol(value.c_str(), &end, 10);
            if (value.empty() || errno != 0 || *end != '\0' || channel <= 0) {
                spdlog::warn("[Settings] {}:{}: invalid hotspot_channel '{}', keeping {}",
                             path, line_number, value, settings.hotspot_channel);
            } else {
                settings.hotspot_channel = static_cast<int>(channel);
            }
        } else if (key == "hotspot_script") {
            settings.hotspot_script = value;
        } else if (key == "supplicant_conf") {
            settings.supplicant_conf = value;
        } else if (key == "supplicant_service") {
            settings.supplicant_service = value;
        } else if (key == "ap_service") {
            settings.ap_service = value;
        } else if (key == "dns_service") {
            settings.dns_service = value;
        } else if (key == "dhcp_client_service") {
            settings.dhcp_client_service = value;
        } else if (key == "use_sudo") {
            settings.use_sudo = parse_bool(value, settings.use_sudo);
        } else {
            spdlog::warn("[Settings] {}:{}: unknown key '{}'", path, line_number, key);
        }
    }

    spdlog::debug("[Settings] Loaded {}", path);
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

bool saveSettingsFile(const std::string& path, const WifiSettings& settings) {
    std::ostringstream out;
    out << "# wifiarbiter settings\n";
    if (!settings.interface.empty()) {
        out << "interface=" << settings.interface << "\n";
    }
    out << "ssid=" << settings.ssid << "\n";
    out << "password=" << settings.password << "\n";
    out << "hotspot_ssid=" << settings.hotspot_ssid << "\n";
    out << "hotspot_password=" << settings.hotspot_password << "\n";
    out << "hotspot_channel=" << settings.hotspot_channel << "\n";
    out << "hotspot_script=" << settings.hotspot_script << "\n";
    out << "supplicant_conf=" << settings.supplicant_conf << "\n";
    out << "supplicant_service=" << settings.supplicant_service << "\n";
    out << "ap_service=" << settings.ap_service << "\n";
    out << "dns_service=" << settings.dns_service << "\n";
    out << "dhcp_client_service=" << settings.dhcp_client_service << "\n";
    out << "use_sudo=" << (settings.use_sudo ? "true" : "false") << "\n";

    // Owner-only before the first byte lands; an existing file keeps its old
    // mode through O_CREAT, hence the fchmod.
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        spdlog::error("[Settings] Cannot write {}: {}", path, std::strerror(errno));
        return false;
    }
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        spdlog::error("[Settings] Could not restrict permissions on {}: {}", path,
                      std::strerror(errno));
        ::close(fd);
        return false;
    }

    bool ok = write_all(fd, out.str());
    int write_errno = errno;
    if (::close(fd) != 0) {
        ok = false;
        write_errno = errno;
    }
    if (!ok) {
        spdlog::error("[Settings] Failed writing {}: {}", path, std::strerror(write_errno));
        return false;
    }
    return true;
}
