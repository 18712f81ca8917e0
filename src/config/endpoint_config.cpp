#include "conduit/config.hpp"
#include "conduit/logging.hpp"
#include <fstream>
#include <cstdint>
#include <cstdlib>

namespace conduit {

bool EndpointConfig::isValid() const {
    return max_frame_size >= MIN_FRAME_SIZE &&
           max_frame_size <= MAX_FRAME_SIZE &&
           max_send_rate > 0 &&
           max_receive_rate > 0 &&
           max_packet_size > 0 &&
           max_packet_size <= MAX_PACKET_SIZE &&
           max_receive_alloc > 0 &&
           max_receive_alloc <= UINT32_MAX &&
           channel_count > 0 &&
           channel_count <= MAX_CHANNELS &&
           timeout_ms > 0 &&
           handshake_timeout_ms > 0 &&
           handshake_resend_ms > 0 &&
           (!keepalive || keepalive_interval_ms > 0);
}

// Trim spaces and tabs at both ends
static std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

static bool parseBool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes";
}

bool loadConfig(const std::string& path, EndpointConfig& cfg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("CONFIG", "Cannot open %s", path.c_str());
        return false;
    }

    EndpointConfig loaded = cfg;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        // Skip empty lines, comments and section headers
        if (line.empty() || line[0] == '#' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        unsigned long long n = std::strtoull(value.c_str(), nullptr, 10);
        bool numeric = true;

        if (key == "max_frame_size") {
            loaded.max_frame_size = n;
        } else if (key == "max_send_rate") {
            loaded.max_send_rate = static_cast<uint32_t>(n);
        } else if (key == "max_receive_rate") {
            loaded.max_receive_rate = static_cast<uint32_t>(n);
        } else if (key == "max_packet_size") {
            loaded.max_packet_size = n;
        } else if (key == "max_receive_alloc") {
            loaded.max_receive_alloc = n;
        } else if (key == "channel_count") {
            loaded.channel_count = static_cast<uint8_t>(n > MAX_CHANNELS ? 0 : n);
        } else if (key == "keepalive") {
            loaded.keepalive = parseBool(value);
            numeric = false;
        } else if (key == "keepalive_interval_ms") {
            loaded.keepalive_interval_ms = static_cast<uint32_t>(n);
        } else if (key == "timeout_ms") {
            loaded.timeout_ms = static_cast<uint32_t>(n);
        } else if (key == "handshake_timeout_ms") {
            loaded.handshake_timeout_ms = static_cast<uint32_t>(n);
        } else if (key == "handshake_resend_ms") {
            loaded.handshake_resend_ms = static_cast<uint32_t>(n);
        } else if (key == "disconnect_timeout_ms") {
            loaded.disconnect_timeout_ms = static_cast<uint32_t>(n);
        } else {
            LOG_DEBUG("CONFIG", "Ignoring unknown key '%s'", key.c_str());
            numeric = false;
        }

        // Every numeric field is carried as 32 bits
        if (numeric && n > UINT32_MAX) {
            LOG_WARN("CONFIG", "%s=%s in %s is out of range", key.c_str(), value.c_str(), path.c_str());
            return false;
        }
    }

    if (!loaded.isValid()) {
        LOG_WARN("CONFIG", "Configuration in %s is out of range", path.c_str());
        return false;
    }

    cfg = loaded;
    return true;
}

bool saveConfig(const std::string& path, const EndpointConfig& cfg) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }

    file << "[Endpoint]\n";
    file << "max_frame_size=" << cfg.max_frame_size << "\n";
    file << "max_send_rate=" << cfg.max_send_rate << "\n";
    file << "max_receive_rate=" << cfg.max_receive_rate << "\n";
    file << "max_packet_size=" << cfg.max_packet_size << "\n";
    file << "max_receive_alloc=" << cfg.max_receive_alloc << "\n";
    file << "channel_count=" << static_cast<int>(cfg.channel_count) << "\n";

    file << "\n[Timers]\n";
    file << "keepalive=" << (cfg.keepalive ? "1" : "0") << "\n";
    file << "keepalive_interval_ms=" << cfg.keepalive_interval_ms << "\n";
    file << "timeout_ms=" << cfg.timeout_ms << "\n";
    file << "handshake_timeout_ms=" << cfg.handshake_timeout_ms << "\n";
    file << "handshake_resend_ms=" << cfg.handshake_resend_ms << "\n";
    file << "disconnect_timeout_ms=" << cfg.disconnect_timeout_ms << "\n";

    return file.good();
}

} // namespace conduit
