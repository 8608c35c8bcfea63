#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <numeric>
#include <tuple>
#include <vector>

#include <baton_drain.hpp>
#include <baton_errors.hpp>
#include <baton_writer.hpp>

#include "baton_mock.hpp"

using namespace baton;
using namespace std::chrono_literals;

namespace
{
    std::vector<uint8_t> make_payload(std::size_t bytes)
    {
        std::vector<uint8_t> ret(bytes);
        for(std::size_t i = 0; i < bytes; i++) {
            ret[i] = uint8_t((i * 7 + 3) & 0xff);
        }
        return ret;
    }
}

struct writer_over_region : public testing::Test
{
    std::vector<uint8_t> m_memory;
    std::unique_ptr<region_t> m_region;
    mock::scripted_waiter_t m_waiter;

    void make_region(std::size_t bytes) {
        m_memory.assign(bytes, 0);
        m_region.reset(new region_t(m_memory.data(), m_memory.size()));
    }

    int32_t word(std::size_t idx) const {
        return reinterpret_cast<const int32_t*>(m_memory.data())[idx];
    }

    void SetUp() override {
        make_region(1024);
    }

    /// reacts the way a well behaved reader does: acknowledges by storing READY
    static WAIT_RESULT acknowledge(region_t& r) {
        r.publish(SEMAPHORE::READY);
        return WAIT_RESULT::OK;
    }
};

struct when_writer_sends_small_payload : public writer_over_region {};

TEST_F(when_writer_sends_small_payload, then_handshake_and_single_chunk_are_published) {
    const auto payload = make_payload(5);

    m_waiter.then([this](const wait_request_t& rq) {
        EXPECT_EQ(rq.m_target, m_region->semaphore_word());
        EXPECT_EQ(rq.m_expected, static_cast<int32_t>(SEMAPHORE::HANDSHAKE));
        EXPECT_EQ(rq.m_timeout, 250ms);

        EXPECT_EQ(word(header::semaphore), static_cast<int32_t>(SEMAPHORE::HANDSHAKE));
        EXPECT_EQ(word(header::total_size), 5);
        EXPECT_EQ(word(header::total_chunks), 1);
        return acknowledge(*m_region);
    });
    m_waiter.then([this, &payload](const wait_request_t& rq) {
        EXPECT_EQ(rq.m_expected, static_cast<int32_t>(SEMAPHORE::PAYLOAD));

        EXPECT_EQ(word(header::semaphore), static_cast<int32_t>(SEMAPHORE::PAYLOAD));
        EXPECT_EQ(word(header::chunk_index), 0);
        EXPECT_EQ(word(header::chunk_offset), 0);
        EXPECT_EQ(word(header::chunk_size), 5);
        EXPECT_TRUE(std::equal(payload.begin(), payload.end(), m_memory.begin() + header::bytes));
        return acknowledge(*m_region);
    });

    writer_t writer(payload, *m_region, 250ms);
    const auto completed = drain(writer, m_waiter);

    EXPECT_EQ(completed.m_total_size, 5);
    EXPECT_EQ(completed.m_total_chunks, 1);
    EXPECT_EQ(m_waiter.m_requests.size(), 2u);
    EXPECT_TRUE(m_waiter.m_script.empty());
    EXPECT_EQ(m_region->semaphore(), SEMAPHORE::READY);
}

TEST_F(when_writer_sends_small_payload, then_empty_payload_needs_handshake_only) {
    const std::vector<uint8_t> payload;

    m_waiter.then([this](const wait_request_t&) {
        EXPECT_EQ(word(header::total_size), 0);
        EXPECT_EQ(word(header::total_chunks), 0);
        return acknowledge(*m_region);
    });

    writer_t writer(payload, *m_region, 250ms);
    const auto completed = drain(writer, m_waiter);

    EXPECT_EQ(completed.m_total_chunks, 0);
    EXPECT_EQ(m_waiter.m_requests.size(), 1u);
    EXPECT_EQ(m_region->semaphore(), SEMAPHORE::READY);
}

struct when_writer_sends_multiple_chunks : public writer_over_region {
    // (chunk index, offset, size) as seen by the peer
    std::vector<std::tuple<int32_t, int32_t, int32_t>> m_chunks;
    std::vector<uint8_t> m_reassembled;

    void script_reader(std::size_t total) {
        m_reassembled.assign(total, 0);
        m_waiter.then([this](const wait_request_t&) { return acknowledge(*m_region); });
        for(int64_t i = 0; i < chunks_for(int64_t(total), m_region->chunk_capacity()); i++) {
            m_waiter.then([this](const wait_request_t&) {
                const int32_t idx = word(header::chunk_index);
                const int32_t off = word(header::chunk_offset);
                const int32_t sz = word(header::chunk_size);
                m_chunks.emplace_back(idx, off, sz);
                std::copy_n(m_memory.begin() + header::bytes, sz, m_reassembled.begin() + off);
                return acknowledge(*m_region);
            });
        }
    }
};

TEST_F(when_writer_sends_multiple_chunks, then_chunk_count_is_ceil_of_size_over_capacity) {
    const int32_t p = m_region->chunk_capacity();
    for(const int32_t len : {0, 1, p - 1, p, p + 1, 5 * p + 3, 2 * p + 1}) {
        SCOPED_TRACE(std::to_string(len));
        const auto payload = make_payload(std::size_t(len));

        writer_t writer(payload, *m_region, 250ms);
        EXPECT_EQ(writer.total_size(), len);
        EXPECT_EQ(writer.total_chunks(), (len + p - 1) / p);
        EXPECT_EQ(writer.total_chunks() == 0, len == 0);
    }
}

TEST_F(when_writer_sends_multiple_chunks, then_chunks_are_ordered_gap_free_and_bounded) {
    const int32_t p = m_region->chunk_capacity();
    const auto payload = make_payload(std::size_t(5 * p + 3));
    script_reader(payload.size());

    writer_t writer(payload, *m_region, 250ms);
    const auto completed = drain(writer, m_waiter);

    ASSERT_EQ(completed.m_total_chunks, 6);
    ASSERT_EQ(m_chunks.size(), 6u);
    for(std::size_t i = 0; i < m_chunks.size(); i++) {
        SCOPED_TRACE(std::to_string(i));
        const auto [idx, off, sz] = m_chunks[i];
        EXPECT_EQ(idx, int32_t(i));
        EXPECT_EQ(off, int32_t(i) * p);
        EXPECT_EQ(sz, i + 1 == m_chunks.size() ? 3 : p);
    }
    EXPECT_EQ(m_reassembled, payload);
    EXPECT_EQ(m_region->semaphore(), SEMAPHORE::READY);
}

TEST_F(when_writer_sends_multiple_chunks, then_example_of_two_capacities_plus_one_takes_three_chunks) {
    ASSERT_EQ(m_region->chunk_capacity(), 1008);
    const auto payload = make_payload(1008 * 2 + 1);
    script_reader(payload.size());

    writer_t writer(payload, *m_region, 250ms);
    const auto completed = drain(writer, m_waiter);

    EXPECT_EQ(completed.m_total_chunks, 3);
    ASSERT_EQ(m_chunks.size(), 3u);
    EXPECT_EQ(m_chunks.back(), std::make_tuple(2, 2016, 1));
    EXPECT_EQ(m_reassembled, payload);
}

struct when_reader_does_not_respond : public writer_over_region {};

TEST_F(when_reader_does_not_respond, then_handshake_timeout_is_raised) {
    const auto payload = make_payload(10);
    m_waiter.then(WAIT_RESULT::TIMED_OUT);

    writer_t writer(payload, *m_region, 100ms);
    EXPECT_THROW(drain(writer, m_waiter), writer::reader_handshake_timeout);
    EXPECT_EQ(m_region->semaphore(), SEMAPHORE::READY);
}

TEST_F(when_reader_does_not_respond, then_handshake_timeout_message_names_the_phase) {
    const auto payload = make_payload(10);
    m_waiter.then(WAIT_RESULT::TIMED_OUT);

    writer_t writer(payload, *m_region, 100ms);
    try {
        drain(writer, m_waiter);
        FAIL() << "timeout expected";
    } catch(const timeout_error& e) {
        EXPECT_NE(std::string(e.what()).find("Reader handshake timeout"), std::string::npos) << e.what();
    }
}

TEST_F(when_reader_does_not_respond, then_chunk_timeout_names_the_chunk) {
    const auto payload = make_payload(10);
    m_waiter.then(WAIT_RESULT::OK).then(WAIT_RESULT::TIMED_OUT);

    writer_t writer(payload, *m_region, 100ms);
    try {
        drain(writer, m_waiter);
        FAIL() << "timeout expected";
    } catch(const writer::reader_chunk_timeout& e) {
        EXPECT_EQ(e.m_chunk, 0);
        EXPECT_EQ(e.m_last_chunk, 0);
        EXPECT_NE(std::string(e.what()).find("Reader timeout on chunk 0/0"), std::string::npos) << e.what();
    }
    EXPECT_EQ(m_region->semaphore(), SEMAPHORE::READY);
}

TEST_F(when_reader_does_not_respond, then_second_chunk_timeout_reports_last_chunk_index) {
    make_region(header::bytes + 16);
    const auto payload = make_payload(40);
    m_waiter.then(WAIT_RESULT::OK).then(WAIT_RESULT::OK).then(WAIT_RESULT::TIMED_OUT);

    writer_t writer(payload, *m_region, 100ms);
    try {
        drain(writer, m_waiter);
        FAIL() << "timeout expected";
    } catch(const writer::reader_chunk_timeout& e) {
        EXPECT_EQ(e.m_chunk, 1);
        EXPECT_EQ(e.m_last_chunk, 2);
        EXPECT_NE(std::string(e.what()).find("Reader timeout on chunk 1/2"), std::string::npos) << e.what();
    }
    EXPECT_EQ(m_waiter.m_requests.size(), 3u);
    EXPECT_EQ(m_region->semaphore(), SEMAPHORE::READY);
}

TEST_F(when_reader_does_not_respond, then_region_is_reusable_for_next_transfer) {
    const auto payload = make_payload(10);
    m_waiter.then(WAIT_RESULT::TIMED_OUT);
    {
        writer_t writer(payload, *m_region, 100ms);
        EXPECT_THROW(drain(writer, m_waiter), writer::reader_handshake_timeout);
    }

    m_waiter.then([this](const wait_request_t&) { return acknowledge(*m_region); });
    m_waiter.then([this](const wait_request_t&) { return acknowledge(*m_region); });

    writer_t writer(payload, *m_region, 100ms);
    EXPECT_EQ(drain(writer, m_waiter).m_total_chunks, 1);
    EXPECT_EQ(m_region->semaphore(), SEMAPHORE::READY);
}

struct when_writer_is_abandoned : public writer_over_region {};

TEST_F(when_writer_is_abandoned, then_destructor_restores_ready) {
    const auto payload = make_payload(10);
    {
        writer_t writer(payload, *m_region, 100ms);
        const auto step = writer.next(std::nullopt);
        ASSERT_TRUE(std::holds_alternative<wait_request_t>(step));
        EXPECT_EQ(m_region->semaphore(), SEMAPHORE::HANDSHAKE);
    }
    EXPECT_EQ(m_region->semaphore(), SEMAPHORE::READY);
}

TEST_F(when_writer_is_abandoned, then_abandoned_with_chunk_staged_restores_ready) {
    const auto payload = make_payload(10);
    {
        writer_t writer(payload, *m_region, 100ms);
        writer.next(std::nullopt);
        writer.next(WAIT_RESULT::OK);
        EXPECT_EQ(m_region->semaphore(), SEMAPHORE::PAYLOAD);
    }
    EXPECT_EQ(m_region->semaphore(), SEMAPHORE::READY);
}

TEST_F(when_writer_is_abandoned, then_unstarted_writer_leaves_region_alone) {
    const auto payload = make_payload(10);
    m_region->publish(SEMAPHORE::PAYLOAD); // someone else's transfer
    {
        writer_t writer(payload, *m_region, 100ms);
    }
    EXPECT_EQ(m_region->semaphore(), SEMAPHORE::PAYLOAD);
}

struct when_writer_is_misused : public writer_over_region {};

TEST_F(when_writer_is_misused, then_next_after_completion_is_a_logic_error) {
    const std::vector<uint8_t> payload;
    m_waiter.then(WAIT_RESULT::OK);

    writer_t writer(payload, *m_region, 100ms);
    drain(writer, m_waiter);
    EXPECT_THROW(writer.next(WAIT_RESULT::OK), std::logic_error);
}

TEST_F(when_writer_is_misused, then_missing_wait_outcome_is_a_logic_error) {
    const auto payload = make_payload(10);

    writer_t writer(payload, *m_region, 100ms);
    writer.next(std::nullopt);
    EXPECT_THROW(writer.next(std::nullopt), std::logic_error);
    EXPECT_EQ(m_region->semaphore(), SEMAPHORE::READY);
}

TEST_F(when_writer_is_misused, then_payload_beyond_int32_is_rejected) {
    // the span is never read, only its length matters
    const std::span<const uint8_t> huge(m_memory.data(), std::size_t(std::numeric_limits<int32_t>::max()) + 1);
    EXPECT_THROW(writer_t(huge, *m_region, 100ms), payload_too_large);
    EXPECT_EQ(m_region->semaphore(), SEMAPHORE::READY);
}
