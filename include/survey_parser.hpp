#ifndef SURVEY_PARSER_HPP
#define SURVEY_PARSER_HPP

#include <optional>
#include <string>
#include <vector>

struct NetworkRecord {
    std::string bssid;
    std::string ssid;                  // empty for hidden networks
    std::optional<int> quality;        // percent, 0-100
    bool encrypted = false;

    int effectiveQuality() const { return quality.value_or(0); }
    std::string toJson() const;
};

class SurveyParser {
public:
    // Parses `iwlist <iface> scan` output. Records come back sorted by
    // descending quality; equal qualities keep their stanza order.
    static std::vector<NetworkRecord> parse(const std::string& raw_scan_text);

    static std::optional<int> parseQualityRatio(const std::string& ratio);
};

#endif
