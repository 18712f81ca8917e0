/**
 * Endpoint Configuration Test Suite
 */

#include "conduit/config.hpp"
#include "conduit/logging.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace conduit;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

static std::string tempPath(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

static void writeFile(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

bool test_defaults_valid() {
    TEST("Default configuration is valid");

    EndpointConfig cfg;
    if (!cfg.isValid()) FAIL("defaults rejected");

    EndpointConfig bad;
    bad.channel_count = 0;
    if (bad.isValid()) FAIL("zero channels accepted");
    bad = EndpointConfig{};
    bad.max_frame_size = MAX_FRAME_SIZE + 1;
    if (bad.isValid()) FAIL("oversized frames accepted");
    bad = EndpointConfig{};
    bad.keepalive_interval_ms = 0;
    if (bad.isValid()) FAIL("zero keepalive interval accepted");
    bad.keepalive = false;
    if (!bad.isValid()) FAIL("interval checked with keepalive off");

    PASS();
    return true;
}

bool test_save_load() {
    TEST("Save then load");

    EndpointConfig cfg;
    cfg.max_frame_size = 1200;
    cfg.max_send_rate = 50000;
    cfg.max_receive_rate = 60000;
    cfg.max_packet_size = 4096;
    cfg.max_receive_alloc = 8192;
    cfg.channel_count = 4;
    cfg.keepalive = false;
    cfg.keepalive_interval_ms = 2500;
    cfg.timeout_ms = 7000;
    cfg.handshake_timeout_ms = 4000;
    cfg.handshake_resend_ms = 250;
    cfg.disconnect_timeout_ms = 1500;

    std::string path = tempPath("conduit_test_save.ini");
    if (!saveConfig(path, cfg)) FAIL("save failed");

    EndpointConfig loaded;
    if (!loadConfig(path, loaded)) FAIL("load failed");
    std::filesystem::remove(path);

    if (loaded.max_frame_size != 1200 || loaded.max_send_rate != 50000 ||
        loaded.max_receive_rate != 60000 || loaded.max_packet_size != 4096 ||
        loaded.max_receive_alloc != 8192 || loaded.channel_count != 4) {
        FAIL("limits differ");
    }
    if (loaded.keepalive || loaded.keepalive_interval_ms != 2500 || loaded.timeout_ms != 7000 ||
        loaded.handshake_timeout_ms != 4000 || loaded.handshake_resend_ms != 250 ||
        loaded.disconnect_timeout_ms != 1500) {
        FAIL("timers differ");
    }

    PASS();
    return true;
}

bool test_partial_file() {
    TEST("Comments, unknown keys and missing keys");

    std::string path = tempPath("conduit_test_partial.ini");
    writeFile(path,
              "# tuned for a slow link\n"
              "[Endpoint]\n"
              "  max_send_rate = 12000  \n"
              "colour=blue\n"
              "not a key value line\n"
              "keepalive=yes\n");

    EndpointConfig cfg;
    cfg.timeout_ms = 1234;
    if (!loadConfig(path, cfg)) FAIL("load failed");
    std::filesystem::remove(path);

    if (cfg.max_send_rate != 12000) FAIL("max_send_rate " << cfg.max_send_rate);
    if (!cfg.keepalive) FAIL("keepalive not parsed");
    if (cfg.timeout_ms != 1234) FAIL("missing key overwrote existing value");

    PASS();
    return true;
}

bool test_invalid_file() {
    TEST("Out-of-range file leaves config untouched");

    std::string path = tempPath("conduit_test_invalid.ini");
    writeFile(path,
              "[Endpoint]\n"
              "max_send_rate=99\n"
              "channel_count=65\n");

    EndpointConfig cfg;
    cfg.max_send_rate = 777;
    if (loadConfig(path, cfg)) FAIL("65 channels accepted");
    std::filesystem::remove(path);

    if (cfg.max_send_rate != 777) FAIL("partially applied");

    PASS();
    return true;
}

bool test_value_overflow() {
    TEST("Values wider than 32 bits are rejected");

    std::string path = tempPath("conduit_test_overflow.ini");
    writeFile(path,
              "[Endpoint]\n"
              "max_send_rate=5000000000\n");

    EndpointConfig cfg;
    cfg.max_send_rate = 777;
    if (loadConfig(path, cfg)) FAIL("5000000000 accepted");
    if (cfg.max_send_rate != 777) FAIL("wrapped to " << cfg.max_send_rate);

    writeFile(path,
              "[Endpoint]\n"
              "max_receive_alloc=4294967296\n");
    if (loadConfig(path, cfg)) FAIL("receive allocation beyond 32 bits accepted");

    writeFile(path,
              "[Endpoint]\n"
              "timeout_ms=4294967295\n"
              "comment_id=99999999999\n");
    if (!loadConfig(path, cfg)) FAIL("largest 32-bit value rejected");
    std::filesystem::remove(path);

    if (cfg.timeout_ms != 4294967295u) FAIL("timeout_ms " << cfg.timeout_ms);

    EndpointConfig wide;
    wide.max_receive_alloc = static_cast<size_t>(UINT32_MAX) + 1;
    if (sizeof(size_t) > 4 && wide.isValid()) FAIL("allocation wider than the wire field");

    PASS();
    return true;
}

bool test_missing_file() {
    TEST("Missing file");

    EndpointConfig cfg;
    if (loadConfig(tempPath("conduit_test_does_not_exist.ini"), cfg)) FAIL("load succeeded");
    if (saveConfig("/nonexistent-dir/conduit.ini", cfg)) FAIL("save succeeded");

    PASS();
    return true;
}

int main() {
    setLogLevel(LogLevel::ERROR);

    std::cout << "=== Endpoint Config Tests ===\n\n";

    test_defaults_valid();
    test_save_load();
    test_partial_file();
    test_invalid_file();
    test_value_overflow();
    test_missing_file();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";
    return (tests_passed == tests_run) ? 0 : 1;
}
