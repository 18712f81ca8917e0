/**
 * Frame Codec Test Suite
 *
 * CRC check value, encode/decode of every frame kind, size accounting,
 * and rejection of corrupted, truncated or malformed input.
 */

#include "protocol/crc32.hpp"
#include "protocol/frame.hpp"
#include "protocol/sequence.hpp"
#include <iostream>
#include <string>

using namespace conduit;
using namespace conduit::protocol;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

static Bytes patternBytes(size_t len, uint8_t seed = 0) {
    Bytes b(len);
    for (size_t i = 0; i < len; i++) {
        b[i] = static_cast<uint8_t>(seed + i * 31);
    }
    return b;
}

static Datagram wholeDatagram(uint32_t seq, uint8_t channel, size_t len) {
    Datagram dg;
    dg.sequence_id = seq;
    dg.channel_id = channel;
    dg.data = patternBytes(len, static_cast<uint8_t>(seq));
    return dg;
}

// ============================================================================
// CRC Tests
// ============================================================================

bool test_crc_check_value() {
    TEST("CRC-32 check value of \"123456789\"");

    std::string check = "123456789";
    Bytes data(check.begin(), check.end());
    uint32_t crc = crc32(data);
    if (crc != 0x11A6F2A3) {
        FAIL("got 0x" << std::hex << crc << std::dec);
    }

    PASS();
    return true;
}

bool test_crc_incremental() {
    TEST("CRC-32 incremental update matches one-shot");

    Bytes data = patternBytes(300);
    ByteSpan all(data);
    uint32_t one_shot = crc32(all);

    uint32_t running = crc32Update(0, all.first(100));
    running = crc32Update(running, all.subspan(100));
    if (running != one_shot) {
        FAIL("incremental result differs");
    }

    PASS();
    return true;
}

// ============================================================================
// Round Trips
// ============================================================================

static bool roundTrip(const Frame& f, const char*& why) {
    Bytes wire = f.serialize();
    if (wire.size() != f.encodedSize()) {
        why = "encodedSize() disagrees with serialize()";
        return false;
    }
    auto parsed = Frame::deserialize(wire);
    if (!parsed) {
        why = "failed to deserialize";
        return false;
    }
    if (!(*parsed == f)) {
        why = "decoded frame differs";
        return false;
    }
    return true;
}

bool test_handshake_frames() {
    TEST("Handshake frame round trips");

    ConnectParams params;
    params.nonce = 0xDEADBEEF;
    params.channel_count = 17;
    params.max_receive_rate = 250000;
    params.max_packet_size = 65536;
    params.max_receive_alloc = 1 << 20;

    const char* why = "";
    if (!roundTrip(Frame::makeConnect(params), why)) FAIL("CONNECT: " << why);
    if (!roundTrip(Frame::makeConnectAck(0x12345678), why)) FAIL("CONNECT_ACK: " << why);
    if (!roundTrip(Frame::makeDisconnect(), why)) FAIL("DISCONNECT: " << why);
    if (!roundTrip(Frame::makeDisconnectAck(), why)) FAIL("DISCONNECT_ACK: " << why);

    if (Frame::makeDisconnect().encodedSize() != Frame::MIN_SIZE) {
        FAIL("DISCONNECT should be kind + CRC only");
    }

    PASS();
    return true;
}

bool test_data_frame() {
    TEST("DATA frame with whole and fragment datagrams");

    Datagram whole = wholeDatagram(ID_MASK, 63, 100);
    whole.window_parent_lead = 4095;
    whole.channel_parent_lead = 12;

    Datagram frag;
    frag.sequence_id = 7;
    frag.channel_id = 3;
    frag.window_parent_lead = 1;
    frag.channel_parent_lead = 1;
    frag.fragment_id = 2;
    frag.last_fragment_id = 5;
    frag.data = patternBytes(64, 9);

    Frame f = Frame::makeData(0xABCDE, true, {whole, frag});

    const char* why = "";
    if (!roundTrip(f, why)) FAIL(why);

    size_t expected = Frame::DATA_OVERHEAD + Datagram::WHOLE_HEADER_SIZE + 100 +
                      Datagram::FRAGMENT_HEADER_SIZE + 64;
    if (f.encodedSize() != expected) {
        FAIL("size " << f.encodedSize() << ", expected " << expected);
    }

    PASS();
    return true;
}

bool test_data_payload_boundaries() {
    TEST("DATA payload sizes 0, 1 and full frame");

    const char* why = "";

    Frame empty = Frame::makeData(1, false, {wholeDatagram(1, 0, 0)});
    if (!roundTrip(empty, why)) FAIL("empty datagram: " << why);

    Frame one = Frame::makeData(2, false, {wholeDatagram(2, 0, 1)});
    if (!roundTrip(one, why)) FAIL("1-byte datagram: " << why);

    size_t max_whole = MAX_FRAME_SIZE - Frame::DATA_OVERHEAD - Datagram::WHOLE_HEADER_SIZE;
    Frame full = Frame::makeData(3, true, {wholeDatagram(3, 5, max_whole)});
    if (!roundTrip(full, why)) FAIL("full datagram: " << why);
    if (full.encodedSize() != MAX_FRAME_SIZE) {
        FAIL("full frame is " << full.encodedSize() << " bytes");
    }

    PASS();
    return true;
}

bool test_ack_frame() {
    TEST("ACK frame round trips (0, 1 and many groups)");

    const char* why = "";
    if (!roundTrip(Frame::makeAck(10, 20, {}), why)) FAIL("no groups: " << why);

    AckGroup g;
    g.base_id = 0xFFFFF;
    g.bitfield = 0x80000001;
    g.nonce = true;
    if (!roundTrip(Frame::makeAck(0, ID_MASK, {g}), why)) FAIL("one group: " << why);

    std::vector<AckGroup> many;
    for (uint32_t i = 0; i < 100; i++) {
        AckGroup a;
        a.base_id = i * 40;
        a.bitfield = 1 | (i << 8);
        a.nonce = (i & 1) != 0;
        many.push_back(a);
    }
    Frame f = Frame::makeAck(123, 456, many);
    if (!roundTrip(f, why)) FAIL("100 groups: " << why);
    if (f.encodedSize() != Frame::ACK_OVERHEAD + 100 * AckGroup::ENCODED_SIZE) {
        FAIL("unexpected ACK size " << f.encodedSize());
    }

    PASS();
    return true;
}

bool test_sync_frame() {
    TEST("SYNC frame round trip");

    const char* why = "";
    if (!roundTrip(Frame::makeSync(0, 0), why)) FAIL(why);
    if (!roundTrip(Frame::makeSync(ID_MASK, 77), why)) FAIL(why);

    PASS();
    return true;
}

// ============================================================================
// Rejection
// ============================================================================

bool test_single_bit_flips() {
    TEST("Every single-bit flip is rejected");

    Frame f = Frame::makeData(42, true, {wholeDatagram(9, 2, 40)});
    Bytes wire = f.serialize();

    for (size_t bit = 0; bit < wire.size() * 8; bit++) {
        Bytes corrupt = wire;
        corrupt[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
        if (Frame::deserialize(corrupt)) {
            FAIL("flip of bit " << bit << " accepted");
        }
    }

    PASS();
    return true;
}

bool test_truncated_and_trailing() {
    TEST("Truncated input and trailing bytes are rejected");

    Bytes wire = Frame::makeSync(5, 6).serialize();

    for (size_t len = 0; len < wire.size(); len++) {
        Bytes cut(wire.begin(), wire.begin() + len);
        if (Frame::deserialize(cut)) {
            FAIL("accepted " << len << "-byte prefix");
        }
    }

    // Valid CRC but one extra body byte
    Bytes body(wire.begin(), wire.end() - Frame::CRC_SIZE);
    body.push_back(0x00);
    uint32_t crc = crc32(body);
    body.push_back(static_cast<uint8_t>(crc >> 24));
    body.push_back(static_cast<uint8_t>(crc >> 16));
    body.push_back(static_cast<uint8_t>(crc >> 8));
    body.push_back(static_cast<uint8_t>(crc));
    if (Frame::deserialize(body)) {
        FAIL("accepted trailing byte");
    }

    PASS();
    return true;
}

// Re-seal a hand-built body with a valid CRC
static Bytes seal(Bytes body) {
    uint32_t crc = crc32(body);
    body.push_back(static_cast<uint8_t>(crc >> 24));
    body.push_back(static_cast<uint8_t>(crc >> 16));
    body.push_back(static_cast<uint8_t>(crc >> 8));
    body.push_back(static_cast<uint8_t>(crc));
    return body;
}

bool test_malformed_fields() {
    TEST("Unknown kind and out-of-range fields are rejected");

    if (Frame::deserialize(seal({0x00}))) FAIL("kind 0 accepted");
    if (Frame::deserialize(seal({0x08}))) FAIL("kind 8 accepted");

    // SYNC with a 24-bit ID that does not fit 20 bits
    if (Frame::deserialize(seal({0x07, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00}))) {
        FAIL("oversized ID accepted");
    }

    // DATA frame with no datagrams
    if (Frame::deserialize(seal({0x05, 0x00, 0x00, 0x01}))) {
        FAIL("empty DATA frame accepted");
    }

    // ACK group with bit 0 clear
    Bytes ack = Frame::makeAck(0, 0, {AckGroup{5, 1, false}}).serialize();
    Bytes body(ack.begin(), ack.end() - Frame::CRC_SIZE);
    body[Frame::ACK_HEADER_SIZE + 3 + 3] &= 0xFE;
    if (Frame::deserialize(seal(body))) {
        FAIL("ack group without its base bit accepted");
    }

    PASS();
    return true;
}

bool test_fragment_payload_size() {
    TEST("Fragment payload size fills a frame exactly");

    size_t f = fragmentPayloadSize(MAX_FRAME_SIZE);

    Datagram dg;
    dg.sequence_id = 1;
    dg.fragment_id = 0;
    dg.last_fragment_id = 1;
    dg.data = patternBytes(f);

    Frame frame = Frame::makeData(0, false, {dg});
    if (frame.encodedSize() != MAX_FRAME_SIZE) {
        FAIL("frame is " << frame.encodedSize() << " bytes");
    }

    PASS();
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== Frame Codec Tests ===\n\n";

    std::cout << "CRC:\n";
    test_crc_check_value();
    test_crc_incremental();

    std::cout << "\nRound trips:\n";
    test_handshake_frames();
    test_data_frame();
    test_data_payload_boundaries();
    test_ack_frame();
    test_sync_frame();
    test_fragment_payload_size();

    std::cout << "\nRejection:\n";
    test_single_bit_flips();
    test_truncated_and_trailing();
    test_malformed_fields();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";
    return (tests_passed == tests_run) ? 0 : 1;
}
