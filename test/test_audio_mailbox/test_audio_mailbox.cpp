/**
 * @file test_audio_mailbox.cpp
 * @brief Unit tests for the single-slot PCM mailbox
 */

#include "unity.h"
#include "audio/audio_mailbox.hpp"

using namespace pdi;

static AudioMailbox* mailbox = nullptr;

static void fillBlock(int16_t* block, size_t n, int16_t value) {
    for (size_t i = 0; i < n; i++) {
        block[i] = value;
    }
}

void setUp(void) {
    mailbox = new AudioMailbox(64);
    mailbox->init();
}

void tearDown(void) {
    delete mailbox;
    mailbox = nullptr;
}

void test_consume_before_publish_is_not_found(void) {
    int16_t out[64];
    size_t count = 99;
    TEST_ASSERT_EQUAL(ESP_ERR_NOT_FOUND, mailbox->consume(out, 64, count));
    TEST_ASSERT_EQUAL(0, count);
}

void test_uninitialized_mailbox_is_invalid_state(void) {
    AudioMailbox raw(16);
    int16_t block[16] = {};
    size_t count = 0;
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, raw.publish(block, 16));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, raw.consume(block, 16, count));
    TEST_ASSERT_FALSE(raw.isSourceHealthy());
}

void test_most_recent_block_wins(void) {
    int16_t a[64], b[64], out[64];
    fillBlock(a, 64, 1);
    fillBlock(b, 64, 2);

    TEST_ASSERT_EQUAL(ESP_OK, mailbox->publish(a, 64));
    TEST_ASSERT_EQUAL(ESP_OK, mailbox->publish(b, 64));

    size_t count = 0;
    TEST_ASSERT_EQUAL(ESP_OK, mailbox->consume(out, 64, count));
    TEST_ASSERT_EQUAL(64, count);
    TEST_ASSERT_EQUAL_INT16(2, out[0]);
    TEST_ASSERT_EQUAL_INT16(2, out[63]);

    // Slot is empty again, the overwritten block is gone for good
    TEST_ASSERT_EQUAL(ESP_ERR_NOT_FOUND, mailbox->consume(out, 64, count));

    MailboxStats stats = mailbox->stats();
    TEST_ASSERT_EQUAL_UINT32(2, stats.published);
    TEST_ASSERT_EQUAL_UINT32(1, stats.overwritten);
    TEST_ASSERT_EQUAL_UINT32(1, stats.consumed);
}

void test_oversized_block_is_rejected(void) {
    int16_t big[65] = {};
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_SIZE, mailbox->publish(big, 65));
}

void test_small_destination_keeps_block(void) {
    int16_t block[32] = {};
    int16_t out[16];
    size_t count = 0;
    TEST_ASSERT_EQUAL(ESP_OK, mailbox->publish(block, 32));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_SIZE, mailbox->consume(out, 16, count));

    int16_t full[64];
    TEST_ASSERT_EQUAL(ESP_OK, mailbox->consume(full, 64, count));
    TEST_ASSERT_EQUAL(32, count);
}

void test_fault_clears_on_next_publish(void) {
    TEST_ASSERT_TRUE(mailbox->isSourceHealthy());

    mailbox->reportFault(ESP_FAIL);
    TEST_ASSERT_FALSE(mailbox->isSourceHealthy());
    TEST_ASSERT_EQUAL(ESP_FAIL, mailbox->lastFault());

    int16_t block[64] = {};
    TEST_ASSERT_EQUAL(ESP_OK, mailbox->publish(block, 64));
    TEST_ASSERT_TRUE(mailbox->isSourceHealthy());
    TEST_ASSERT_EQUAL_UINT32(1, mailbox->stats().faults);
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_consume_before_publish_is_not_found);
    RUN_TEST(test_uninitialized_mailbox_is_invalid_state);
    RUN_TEST(test_most_recent_block_wins);
    RUN_TEST(test_oversized_block_is_rejected);
    RUN_TEST(test_small_destination_keeps_block);
    RUN_TEST(test_fault_clears_on_next_publish);
    return UNITY_END();
}
