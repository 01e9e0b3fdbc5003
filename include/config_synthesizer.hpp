#ifndef CONFIG_SYNTHESIZER_HPP
#define CONFIG_SYNTHESIZER_HPP

#include <string>

// Maintains the network={...} blocks of a wpa_supplicant configuration.
class ConfigSynthesizer {
public:
    // Replaces (or appends) the block for `ssid`, keeping every other block
    // and top-level line as it was. An empty password writes an open network.
    // The file ends up mode 0600. Returns false on any I/O failure.
    bool upsertClientBlock(const std::string& path, const std::string& ssid,
                           const std::string& password);
};

// The rewrite itself, on in-memory text.
std::string rewriteClientConfig(const std::string& existing, const std::string& ssid,
                                const std::string& password);

#endif
