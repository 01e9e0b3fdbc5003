#include "survey_parser.hpp"

#include "json_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

static std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

static bool parse_int(const std::string& text, long& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    value = std::strtol(text.c_str(), &end, 10);
    return errno == 0 && end != nullptr && *end == '\0';
}

// Collects one Cell stanza. A stanza counts as present once any field is set.
struct StanzaAccumulator {
    NetworkRecord record;
    bool has_fields = false;

    void flushInto(std::vector<NetworkRecord>& out) {
        if (has_fields) {
            out.push_back(record);
        }
        record = NetworkRecord();
        has_fields = false;
    }
};

std::optional<int> SurveyParser::parseQualityRatio(const std::string& ratio) {
    size_t slash = ratio.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    long current = 0;
    long max = 0;
    if (!parse_int(ratio.substr(0, slash), current) || !parse_int(ratio.substr(slash + 1), max)) {
        return std::nullopt;
    }
    if (max <= 0 || current < 0) {
        return std::nullopt;
    }

    if (current >= max) {
        return 100;
    }
    // current < max here, so the ratio lies in [0, 100) and cannot overflow.
    long double percent = static_cast<long double>(current) * 100 / max;
    return static_cast<int>(percent);
}

std::vector<NetworkRecord> SurveyParser::parse(const std::string& raw_scan_text) {
    std::vector<NetworkRecord> networks;
    StanzaAccumulator current;

    std::istringstream stream(raw_scan_text);
    std::string raw_line;
    while (std::getline(stream, raw_line)) {
        std::string line = trim(raw_line);
        if (line.empty()) continue;

        size_t pos;
        if (line.find("Cell") != std::string::npos &&
            (pos = line.find("Address:")) != std::string::npos) {
            current.flushInto(networks);
            current.record.bssid = trim(line.substr(pos + 8));
            current.has_fields = true;
        } else if ((pos = line.find("ESSID:")) != std::string::npos) {
            std::string essid = trim(line.substr(pos + 6));
            while (!essid.empty() && essid.front() == '"') essid.erase(0, 1);
            while (!essid.empty() && essid.back() == '"') essid.pop_back();
            if (!essid.empty()) {
                current.record.ssid = essid;
                current.has_fields = true;
            }
        } else if ((pos = line.find("Quality=")) != std::string::npos ||
                   (pos = line.find("Quality:")) != std::string::npos) {
            std::string token = line.substr(pos + 8);
            token = token.substr(0, token.find_first_of(" \t"));
            auto quality = parseQualityRatio(token);
            if (quality) {
                current.record.quality = quality;
                current.has_fields = true;
            } else {
                spdlog::debug("[Scanner] Unparsable quality '{}'", token);
            }
        } else if ((pos = line.find("Encryption key:")) != std::string::npos) {
            std::string value = trim(line.substr(pos + 15));
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            current.record.encrypted = (value == "on");
            current.has_fields = true;
        }
    }
    current.flushInto(networks);

    std::stable_sort(networks.begin(), networks.end(),
        [](const NetworkRecord& a, const NetworkRecord& b) {
            return a.effectiveQuality() > b.effectiveQuality();
        });

    return networks;
}

std::string NetworkRecord::toJson() const {
    std::ostringstream json;
    json << "{";
    json << "\"bssid\":" << jsonQuote(bssid) << ",";
    json << "\"ssid\":" << jsonQuote(ssid) << ",";
    if (quality) {
        json << "\"quality\":" << *quality << ",";
    } else {
        json << "\"quality\":null,";
    }
    json << "\"encrypted\":" << (encrypted ? "true" : "false");
    json << "}";
    return json.str();
}
