#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include <baton_errors.hpp>
#include <baton_region.hpp>

using namespace baton;

TEST(region_layout, header_is_four_words) {
    EXPECT_EQ(header::words, 4u);
    EXPECT_EQ(header::bytes, 16u);
    EXPECT_EQ(header::total_size, header::chunk_index);
    EXPECT_EQ(header::total_chunks, header::chunk_offset);
}

TEST(region_layout, chunks_for_rounds_up) {
    EXPECT_EQ(chunks_for(0, 1008), 0);
    EXPECT_EQ(chunks_for(1, 1008), 1);
    EXPECT_EQ(chunks_for(5, 1008), 1);
    EXPECT_EQ(chunks_for(1007, 1008), 1);
    EXPECT_EQ(chunks_for(1008, 1008), 1);
    EXPECT_EQ(chunks_for(1009, 1008), 2);
    EXPECT_EQ(chunks_for(1008 * 2 + 1, 1008), 3);
    EXPECT_EQ(chunks_for(1008 * 5 + 3, 1008), 6);
}

TEST(region_layout, semaphore_names) {
    EXPECT_EQ(to_string(SEMAPHORE::READY), "READY");
    EXPECT_EQ(to_string(SEMAPHORE::HANDSHAKE), "HANDSHAKE");
    EXPECT_EQ(to_string(SEMAPHORE::PAYLOAD), "PAYLOAD");
    EXPECT_EQ(to_string(static_cast<SEMAPHORE>(7)), "UNKNOWN(7)");
}

struct when_region_is_malformed : public testing::Test
{
    std::vector<uint8_t> m_memory = std::vector<uint8_t>(2048);
};

TEST_F(when_region_is_malformed, then_size_not_multiple_of_word_is_rejected) {
    EXPECT_THROW(region_t(m_memory.data(), 1023), region::size_alignment);
    EXPECT_THROW(region_t(m_memory.data(), 18), region::size_alignment);
}

TEST_F(when_region_is_malformed, then_size_without_payload_area_is_rejected) {
    EXPECT_THROW(region_t(m_memory.data(), 16), region::too_small);
    EXPECT_THROW(region_t(m_memory.data(), 4), region::too_small);
    EXPECT_THROW(region_t(m_memory.data(), 0), region::too_small);
}

TEST_F(when_region_is_malformed, then_setup_errors_share_a_base) {
    EXPECT_THROW(region_t(m_memory.data(), 16), setup_error);
    EXPECT_THROW(region_t(m_memory.data(), 17), setup_error);
}

TEST_F(when_region_is_malformed, then_unaligned_start_is_rejected) {
    EXPECT_THROW(region_t(m_memory.data() + 1, 1020), region::misaligned);
}

TEST_F(when_region_is_malformed, then_region_beyond_int32_is_rejected) {
    // validation never dereferences the pointer
    EXPECT_THROW(region_t(m_memory.data(), std::size_t(1) << 31), region::too_large);
}

TEST_F(when_region_is_malformed, then_header_is_untouched) {
    std::fill(m_memory.begin(), m_memory.end(), uint8_t(0xAB));
    EXPECT_THROW(region_t(m_memory.data(), 16), region::too_small);
    for(auto b : m_memory) {
        ASSERT_EQ(b, 0xAB);
    }
}

struct when_region_is_valid : public testing::Test
{
    std::vector<uint8_t> m_memory = std::vector<uint8_t>(1024);
    region_t m_region{m_memory.data(), m_memory.size()};

    int32_t word(std::size_t idx) const {
        return reinterpret_cast<const int32_t*>(m_memory.data())[idx];
    }
};

TEST_F(when_region_is_valid, then_capacity_excludes_header) {
    EXPECT_EQ(m_region.chunk_capacity(), 1008);
    EXPECT_EQ(m_region.payload().size(), 1008u);
    EXPECT_EQ(m_region.payload().data(), m_memory.data() + 16);
    EXPECT_EQ(reinterpret_cast<uint8_t*>(m_region.semaphore_word()), m_memory.data());
}

TEST_F(when_region_is_valid, then_smallest_region_has_one_word_of_payload) {
    region_t smallest(m_memory.data(), 20);
    EXPECT_EQ(smallest.chunk_capacity(), 4);
}

TEST_F(when_region_is_valid, then_fresh_region_is_ready) {
    EXPECT_EQ(m_region.semaphore(), SEMAPHORE::READY);
    EXPECT_TRUE(std::holds_alternative<header::ready_t>(m_region.read_phase()));
}

TEST_F(when_region_is_valid, then_handshake_fields_are_words_1_and_2) {
    m_region.write_handshake(header::handshake_t{ .m_total_size = 5, .m_total_chunks = 1 });
    m_region.publish(SEMAPHORE::HANDSHAKE);

    EXPECT_EQ(word(0), 1);
    EXPECT_EQ(word(1), 5);
    EXPECT_EQ(word(2), 1);

    const auto phase = m_region.read_phase();
    const auto* h = std::get_if<header::handshake_t>(&phase);
    ASSERT_TRUE(h != nullptr);
    EXPECT_EQ(h->m_total_size, 5);
    EXPECT_EQ(h->m_total_chunks, 1);
}

TEST_F(when_region_is_valid, then_payload_fields_are_words_1_to_3) {
    m_region.write_payload_header(header::payload_t{ .m_chunk_index = 2, .m_chunk_offset = 2016, .m_chunk_size = 7 });
    m_region.publish(SEMAPHORE::PAYLOAD);

    EXPECT_EQ(word(0), 2);
    EXPECT_EQ(word(1), 2);
    EXPECT_EQ(word(2), 2016);
    EXPECT_EQ(word(3), 7);

    const auto phase = m_region.read_phase();
    const auto* p = std::get_if<header::payload_t>(&phase);
    ASSERT_TRUE(p != nullptr);
    EXPECT_EQ(p->m_chunk_index, 2);
    EXPECT_EQ(p->m_chunk_offset, 2016);
    EXPECT_EQ(p->m_chunk_size, 7);
}

TEST_F(when_region_is_valid, then_phase_follows_the_semaphore_not_the_words) {
    m_region.write_payload_header(header::payload_t{ .m_chunk_index = 1, .m_chunk_offset = 2, .m_chunk_size = 3 });
    m_region.publish(SEMAPHORE::HANDSHAKE);

    const auto phase = m_region.read_phase();
    EXPECT_FALSE(std::holds_alternative<header::payload_t>(phase));
    ASSERT_TRUE(std::holds_alternative<header::handshake_t>(phase));
    EXPECT_EQ(header::to_string(phase), "HANDSHAKE");
}

TEST_F(when_region_is_valid, then_unknown_semaphore_is_reported) {
    reinterpret_cast<int32_t*>(m_memory.data())[0] = 42;

    const auto phase = m_region.read_phase();
    const auto* u = std::get_if<header::unknown_t>(&phase);
    ASSERT_TRUE(u != nullptr);
    EXPECT_EQ(u->m_value, 42);
    EXPECT_EQ(header::to_string(phase), "UNKNOWN(42)");
}
