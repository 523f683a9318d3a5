// Unit tests for the toggle handshake (ToggleChannel / ToggleSynchronizer).
//
// Verifies:
//   1. A flip is reported on the third consumer edge after it is first
//      sampled, and only once.
//   2. A held level never produces an event.
//   3. Spaced flips are each reported exactly once, in both directions.
//   4. The payload published with a flip is what the consumer reads on the
//      event edge.
//   5. reset() clears the synchroniser.

#include "cdc_toggle.hpp"
#include "test_assert.hpp"
#include "video_mode.hpp"

#include <cstdint>
#include <cstdio>

// -----------------------------------------------------------------------
// Test 1: latency and single report
// -----------------------------------------------------------------------
static void test_edge_latency(TestResults& results) {
    std::printf("  test_edge_latency...\n");
    ToggleSynchronizer sync;

    for (int i = 0; i < 5; i++) {
        TEST_ASSERT(results, !sync.eval(0), "No event before the producer flips");
    }

    // Edge 1 samples the new level, edge 3 reports it.
    TEST_ASSERT(results, !sync.eval(1), "Edge 1: level sampled, no event yet");
    TEST_ASSERT(results, !sync.eval(1), "Edge 2: no event yet");
    TEST_ASSERT(results, sync.eval(1), "Edge 3: event reported");
    TEST_ASSERT_EQ(results, sync.level(), 1, "Synchronised level follows producer");

    for (int i = 0; i < 10; i++) {
        TEST_ASSERT(results, !sync.eval(1), "Event reported only once");
    }

    std::printf("  test_edge_latency: PASS\n");
}

// -----------------------------------------------------------------------
// Test 2: a held level is never an event
// -----------------------------------------------------------------------
static void test_level_is_not_event(TestResults& results) {
    std::printf("  test_level_is_not_event...\n");
    ToggleSynchronizer sync;

    int events = 0;
    for (int i = 0; i < 100; i++) {
        events += sync.eval(0) ? 1 : 0;
    }
    TEST_ASSERT_EQ(results, events, 0, "Held low level produced events");

    std::printf("  test_level_is_not_event: PASS\n");
}

// -----------------------------------------------------------------------
// Test 3: spaced flips are each seen once
// -----------------------------------------------------------------------
static void test_spaced_flips_exactly_once(TestResults& results) {
    std::printf("  test_spaced_flips_exactly_once...\n");
    ToggleChannel<ToggleEvent> producer;
    ToggleSynchronizer consumer;

    // Producer flips every 4th consumer edge (just over the 3-edge latency),
    // 40 times; also covers 1 -> 0 transitions.
    constexpr int FLIPS = 40;
    constexpr int SPACING = ToggleSynchronizer::STAGES + 1;
    int events = 0;
    int edges = 0;

    for (int f = 0; f < FLIPS; f++) {
        producer.flip();
        for (int i = 0; i < SPACING; i++) {
            events += consumer.eval(producer.level) ? 1 : 0;
            edges++;
        }
    }
    // Drain.
    for (int i = 0; i < SPACING; i++) {
        events += consumer.eval(producer.level) ? 1 : 0;
    }

    TEST_ASSERT_EQ(results, events, FLIPS, "Every flip reported exactly once");
    TEST_ASSERT_EQ(results, edges, FLIPS * SPACING, "Edge count");

    std::printf("  test_spaced_flips_exactly_once: PASS\n");
}

// -----------------------------------------------------------------------
// Test 4: payload travels with the flip, including across a slow consumer
// -----------------------------------------------------------------------
static void test_payload_on_event(TestResults& results) {
    std::printf("  test_payload_on_event...\n");
    ToggleChannel<FetchRequest> producer;
    ToggleSynchronizer consumer;

    // Producer runs 3x faster than the consumer: it ticks 3 times per
    // consumer edge but raises an event only every 30 producer ticks.
    uint32_t next_addr = 0x1000;
    int producer_tick = 0;
    int received = 0;
    uint32_t expected_addr = 0x1000;

    for (int edge = 0; edge < 200; edge++) {
        for (int p = 0; p < 3; p++) {
            if (producer_tick % 30 == 0) {
                producer.signal(FetchRequest{.address = next_addr, .words = 5});
                next_addr += 80;
            }
            producer_tick++;
        }
        if (consumer.eval(producer.level)) {
            TEST_ASSERT_EQ(results, producer.payload.address, expected_addr, "Payload address");
            TEST_ASSERT_EQ(results, producer.payload.words, 5, "Payload words");
            expected_addr += 80;
            received++;
        }
    }

    // 600 producer ticks -> 20 events; the last one may still be in flight.
    TEST_ASSERT(results, received >= 19 && received <= 20, "All but the in-flight event received");

    std::printf("  test_payload_on_event: PASS\n");
}

// -----------------------------------------------------------------------
// Test 5: reset clears the shift register
// -----------------------------------------------------------------------
static void test_reset(TestResults& results) {
    std::printf("  test_reset...\n");
    ToggleSynchronizer sync;

    sync.eval(1);
    sync.eval(1);
    sync.reset();
    TEST_ASSERT_EQ(results, sync.level(), 0, "Level cleared by reset");

    // A level of 0 after reset matches the stages: no event.
    for (int i = 0; i < 5; i++) {
        TEST_ASSERT(results, !sync.eval(0), "No event after reset with level 0");
    }

    ToggleChannel<FetchRequest> ch;
    ch.signal(FetchRequest{.address = 16, .words = 1});
    ch.reset();
    TEST_ASSERT_EQ(results, ch.level, 0, "Channel level cleared");
    TEST_ASSERT(results, ch.payload == FetchRequest{}, "Channel payload cleared");

    std::printf("  test_reset: PASS\n");
}

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------
int main() {
    std::printf("Running toggle handshake tests...\n\n");

    TestResults results;

    test_edge_latency(results);
    test_level_is_not_event(results);
    test_spaced_flips_exactly_once(results);
    test_payload_on_event(results);
    test_reset(results);

    return test_summary(results);
}
