// Unit tests for the configuration RegisterBank.
//
// Verifies:
//   1. Power-on register image matches the 640x480 defaults.
//   2. Full-word writes land on the right shadow fields and read back.
//   3. Byte-enabled writes only touch the enabled bytes.
//   4. Pitch is truncated to 13 bits.
//   5. LOAD_MODE flips the toggle only when byte 0 is enabled, and the
//      toggle payload tracks the shadow set.
//   6. Unmapped addresses raise ConfigError on write and read.
//   7. Port-level eval(): write strobe, read strobe and rd_valid.

#include "register_bank.hpp"
#include "test_assert.hpp"
#include "video_error.hpp"

#include <cstdint>
#include <cstdio>

// -----------------------------------------------------------------------
// Test 1: power-on image
// -----------------------------------------------------------------------
static void test_reset_values(TestResults& results) {
    std::printf("  test_reset_values...\n");
    RegisterBank rb;

    TEST_ASSERT(results, rb.shadow() == default_video_mode(), "Shadow set at power-on");
    TEST_ASSERT_EQ(results, rb.read(REG_H_DISPLAY), pack_fields(640, 47), "H_DISPLAY");
    TEST_ASSERT_EQ(results, rb.read(REG_H_SYNC), pack_fields(799, 96), "H_SYNC");
    TEST_ASSERT_EQ(results, rb.read(REG_V_DISPLAY), pack_fields(480, 32), "V_DISPLAY");
    TEST_ASSERT_EQ(results, rb.read(REG_V_SYNC), pack_fields(524, 2), "V_SYNC");
    TEST_ASSERT_EQ(results, rb.read(REG_FORMAT), 0u, "FORMAT");
    TEST_ASSERT_EQ(results, rb.read(REG_BASE_ADDR), 0u, "BASE_ADDR");
    TEST_ASSERT_EQ(results, rb.read(REG_PITCH), 80u, "PITCH");
    TEST_ASSERT_EQ(results, rb.load_mode.level, 0, "Load toggle low");

    std::printf("  test_reset_values: PASS\n");
}

// -----------------------------------------------------------------------
// Test 2: full-word writes
// -----------------------------------------------------------------------
static void test_full_word_writes(TestResults& results) {
    std::printf("  test_full_word_writes...\n");
    RegisterBank rb;

    rb.write(REG_H_DISPLAY, pack_fields(800, 87));
    rb.write(REG_H_SYNC, pack_fields(1055, 128));
    rb.write(REG_V_DISPLAY, pack_fields(600, 22));
    rb.write(REG_V_SYNC, pack_fields(627, 4));
    rb.write(REG_FORMAT, 0x0503);
    rb.write(REG_BASE_ADDR, 0x00200000);
    rb.write(REG_PITCH, 100);

    const VideoMode& s = rb.shadow();
    TEST_ASSERT_EQ(results, s.h.start, 87, "h.start");
    TEST_ASSERT_EQ(results, s.h.width, 800, "h.width");
    TEST_ASSERT_EQ(results, s.h.sync, 128, "h.sync");
    TEST_ASSERT_EQ(results, s.h.total, 1055, "h.total");
    TEST_ASSERT_EQ(results, s.v.start, 22, "v.start");
    TEST_ASSERT_EQ(results, s.v.width, 600, "v.width");
    TEST_ASSERT_EQ(results, s.v.sync, 4, "v.sync");
    TEST_ASSERT_EQ(results, s.v.total, 627, "v.total");
    TEST_ASSERT_EQ(results, s.polarity, 0x3, "polarity");
    TEST_ASSERT_EQ(results, s.pixel_format, 0x05, "pixel_format");
    TEST_ASSERT_EQ(results, s.base_addr, 0x00200000u, "base_addr");
    TEST_ASSERT_EQ(results, s.pitch, 100, "pitch");

    TEST_ASSERT_EQ(results, rb.read(REG_H_SYNC), pack_fields(1055, 128), "H_SYNC read-back");
    TEST_ASSERT_EQ(results, rb.read(REG_FORMAT), 0x0503u, "FORMAT read-back");

    // Polarity is two bits; the rest of the low byte is not stored.
    rb.write(REG_FORMAT, 0x00FE);
    TEST_ASSERT_EQ(results, rb.shadow().polarity, 0x2, "Only polarity bits [1:0] kept");

    // Shadow writes alone never flip the toggle.
    TEST_ASSERT_EQ(results, rb.load_mode.level, 0, "No load without LOAD_MODE");

    std::printf("  test_full_word_writes: PASS\n");
}

// -----------------------------------------------------------------------
// Test 3: byte enables
// -----------------------------------------------------------------------
static void test_byte_enables(TestResults& results) {
    std::printf("  test_byte_enables...\n");
    RegisterBank rb;

    // Upper half only: width changes, start keeps 47.
    rb.write(REG_H_DISPLAY, pack_fields(320, 0xFFFF), 0xC);
    TEST_ASSERT_EQ(results, rb.shadow().h.width, 320, "Width written through bytes 2-3");
    TEST_ASSERT_EQ(results, rb.shadow().h.start, 47, "Start untouched");

    // Single byte into the middle of the base address.
    rb.write(REG_BASE_ADDR, 0x12345678, 0x4);
    TEST_ASSERT_EQ(results, rb.shadow().base_addr, 0x00340000u, "Byte 2 of base address");
    rb.write(REG_BASE_ADDR, 0xAABBCCDD, 0x9);
    TEST_ASSERT_EQ(results, rb.shadow().base_addr, 0xAA3400DDu, "Bytes 0 and 3 of base address");

    // No byte enables: nothing changes.
    rb.write(REG_V_SYNC, 0xFFFFFFFF, 0x0);
    TEST_ASSERT_EQ(results, rb.read(REG_V_SYNC), pack_fields(524, 2), "Zero strobe is a no-op");

    // Pixel format byte alone.
    rb.write(REG_FORMAT, 0x0000'0900, 0x2);
    TEST_ASSERT_EQ(results, rb.shadow().pixel_format, 9, "Format byte");
    TEST_ASSERT_EQ(results, rb.shadow().polarity, 0, "Polarity untouched");

    std::printf("  test_byte_enables: PASS\n");
}

// -----------------------------------------------------------------------
// Test 4: pitch width
// -----------------------------------------------------------------------
static void test_pitch_truncation(TestResults& results) {
    std::printf("  test_pitch_truncation...\n");
    RegisterBank rb;

    rb.write(REG_PITCH, 0xFFFF);
    TEST_ASSERT_EQ(results, rb.shadow().pitch, 0x1FFF, "Pitch keeps 13 bits");
    rb.write(REG_PITCH, 0x2050);
    TEST_ASSERT_EQ(results, rb.shadow().pitch, 0x0050, "Bit 13 dropped");

    std::printf("  test_pitch_truncation: PASS\n");
}

// -----------------------------------------------------------------------
// Test 5: LOAD_MODE toggle
// -----------------------------------------------------------------------
static void test_load_mode_toggle(TestResults& results) {
    std::printf("  test_load_mode_toggle...\n");
    RegisterBank rb;

    rb.write(REG_LOAD_MODE, 1);
    TEST_ASSERT_EQ(results, rb.load_mode.level, 1, "First load flips to 1");
    rb.write(REG_LOAD_MODE, 0);
    TEST_ASSERT_EQ(results, rb.load_mode.level, 0, "Data value is ignored, every write flips");

    rb.write(REG_LOAD_MODE, 1, 0xE);
    TEST_ASSERT_EQ(results, rb.load_mode.level, 0, "No flip without byte 0 enabled");
    rb.write(REG_LOAD_MODE, 1, 0x1);
    TEST_ASSERT_EQ(results, rb.load_mode.level, 1, "Byte 0 alone flips");
    TEST_ASSERT_EQ(results, rb.read(REG_LOAD_MODE), 1u, "Toggle readable");

    // Payload always equals the current shadow set.
    rb.write(REG_PITCH, 160);
    TEST_ASSERT(results, rb.load_mode.payload == rb.shadow(), "Payload follows shadow");
    TEST_ASSERT_EQ(results, rb.load_mode.payload.pitch, 160, "Payload pitch");

    rb.reset();
    TEST_ASSERT_EQ(results, rb.load_mode.level, 0, "reset() clears the toggle");
    TEST_ASSERT(results, rb.load_mode.payload == default_video_mode(), "reset() restores payload");

    std::printf("  test_load_mode_toggle: PASS\n");
}

// -----------------------------------------------------------------------
// Test 6: unmapped addresses
// -----------------------------------------------------------------------
static void test_unmapped_address(TestResults& results) {
    std::printf("  test_unmapped_address...\n");
    RegisterBank rb;

    TEST_ASSERT_THROWS(results, rb.write(0x014, 1), ConfigError, "Write to 0x014 must be fatal");
    TEST_ASSERT_THROWS(results, rb.write(0x10C, 1), ConfigError, "Write to 0x10C must be fatal");
    TEST_ASSERT_THROWS(results, rb.write(0x002, 1), ConfigError, "Unaligned offset must be fatal");
    TEST_ASSERT_THROWS(results, (void)rb.read(0x200), ConfigError, "Read of 0x200 must be fatal");

    // The failed writes changed nothing.
    TEST_ASSERT(results, rb.shadow() == default_video_mode(), "Shadow unchanged");

    std::printf("  test_unmapped_address: PASS\n");
}

// -----------------------------------------------------------------------
// Test 7: port-level access
// -----------------------------------------------------------------------
static void test_port_access(TestResults& results) {
    std::printf("  test_port_access...\n");
    RegisterBank rb;

    rb.wr_en   = 1;
    rb.wr_addr = REG_PITCH;
    rb.wr_data = 96;
    rb.wr_strb = 0xF;
    rb.eval();
    rb.wr_en = 0;
    TEST_ASSERT_EQ(results, rb.shadow().pitch, 96, "Write through ports");
    TEST_ASSERT_EQ(results, rb.rd_valid, 0, "No read issued");

    rb.rd_en   = 1;
    rb.rd_addr = REG_PITCH;
    rb.eval();
    TEST_ASSERT_EQ(results, rb.rd_valid, 1, "rd_valid with read strobe");
    TEST_ASSERT_EQ(results, rb.rd_data, 96u, "Read through ports");

    rb.rd_en = 0;
    rb.eval();
    TEST_ASSERT_EQ(results, rb.rd_valid, 0, "rd_valid is a single-cycle pulse");

    rb.wr_en   = 1;
    rb.wr_addr = 0x300;
    TEST_ASSERT_THROWS(results, rb.eval(), ConfigError, "Unmapped port write must be fatal");

    std::printf("  test_port_access: PASS\n");
}

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------
int main() {
    std::printf("Running RegisterBank tests...\n\n");

    TestResults results;

    test_reset_values(results);
    test_full_word_writes(results);
    test_byte_enables(results);
    test_pitch_truncation(results);
    test_load_mode_toggle(results);
    test_unmapped_address(results);
    test_port_access(results);

    return test_summary(results);
}
