#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include <baton_drain.hpp>
#include <baton_errors.hpp>
#include <baton_reader.hpp>

#include "baton_mock.hpp"

using namespace baton;
using namespace std::chrono_literals;

struct reader_over_region : public testing::Test
{
    std::vector<uint8_t> m_memory = std::vector<uint8_t>(1024);
    region_t m_region{m_memory.data(), m_memory.size()};
    mock::scripted_waiter_t m_waiter;

    int32_t& word(std::size_t idx) {
        return reinterpret_cast<int32_t*>(m_memory.data())[idx];
    }

    /// stages what a writer publishes for a handshake
    void handshake(int32_t total_size, int32_t total_chunks) {
        word(header::total_size) = total_size;
        word(header::total_chunks) = total_chunks;
        word(header::semaphore) = static_cast<int32_t>(SEMAPHORE::HANDSHAKE);
    }

    /// stages what a writer publishes for a chunk, payload bytes are filled with `fill`
    void chunk(int32_t index, int32_t offset, int32_t size, uint8_t fill) {
        std::fill_n(m_memory.begin() + header::bytes, std::min<int32_t>(size, m_region.chunk_capacity()), fill);
        word(header::chunk_index) = index;
        word(header::chunk_offset) = offset;
        word(header::chunk_size) = size;
        word(header::semaphore) = static_cast<int32_t>(SEMAPHORE::PAYLOAD);
    }

    mock::scripted_waiter_t::reaction_t stage_chunk(int32_t index, int32_t offset, int32_t size, uint8_t fill) {
        return [=, this](const wait_request_t& rq) {
            EXPECT_EQ(rq.m_expected, static_cast<int32_t>(SEMAPHORE::READY));
            EXPECT_EQ(word(header::semaphore), static_cast<int32_t>(SEMAPHORE::READY)) << "reader must acknowledge before the next chunk";
            chunk(index, offset, size, fill);
            return WAIT_RESULT::OK;
        };
    }

    template <typename E>
    std::string expect_failure() {
        reader_t reader(m_region, 100ms);
        try {
            drain(reader, m_waiter);
        } catch(const E& e) {
            return e.what();
        }
        ADD_FAILURE() << "exception expected";
        return {};
    }
};

struct when_reader_receives_payload : public reader_over_region {};

TEST_F(when_reader_receives_payload, then_single_chunk_is_returned) {
    handshake(5, 1);
    m_waiter.then([this](const wait_request_t& rq) {
        EXPECT_EQ(rq.m_target, m_region.semaphore_word());
        EXPECT_EQ(rq.m_expected, static_cast<int32_t>(SEMAPHORE::READY));
        EXPECT_EQ(rq.m_timeout, 100ms);
        return WAIT_RESULT::OK;
    });
    m_waiter.then(stage_chunk(0, 0, 5, 0x5A));

    reader_t reader(m_region, 100ms);
    const auto data = drain(reader, m_waiter);

    EXPECT_EQ(data, std::vector<uint8_t>(5, 0x5A));
    EXPECT_EQ(m_waiter.m_requests.size(), 2u);
    EXPECT_EQ(m_region.semaphore(), SEMAPHORE::READY);
}

TEST_F(when_reader_receives_payload, then_empty_payload_is_acknowledged) {
    handshake(0, 0);
    m_waiter.then(WAIT_RESULT::OK);

    reader_t reader(m_region, 100ms);
    const auto data = drain(reader, m_waiter);

    EXPECT_TRUE(data.empty());
    EXPECT_EQ(m_waiter.m_requests.size(), 1u);
    EXPECT_EQ(m_region.semaphore(), SEMAPHORE::READY);
}

TEST_F(when_reader_receives_payload, then_chunks_are_placed_at_their_offsets) {
    handshake(2016 + 10, 3);
    m_waiter.then(WAIT_RESULT::OK);
    m_waiter.then(stage_chunk(0, 0, 1008, 1));
    m_waiter.then(stage_chunk(1, 1008, 1008, 2));
    m_waiter.then(stage_chunk(2, 2016, 10, 3));

    reader_t reader(m_region, 100ms);
    const auto data = drain(reader, m_waiter);

    ASSERT_EQ(data.size(), 2026u);
    EXPECT_TRUE(std::all_of(data.begin(), data.begin() + 1008, [](uint8_t b) { return b == 1; }));
    EXPECT_TRUE(std::all_of(data.begin() + 1008, data.begin() + 2016, [](uint8_t b) { return b == 2; }));
    EXPECT_TRUE(std::all_of(data.begin() + 2016, data.end(), [](uint8_t b) { return b == 3; }));
    EXPECT_EQ(m_region.semaphore(), SEMAPHORE::READY);
}

struct when_writer_does_not_respond : public reader_over_region {};

TEST_F(when_writer_does_not_respond, then_handshake_timeout_is_raised) {
    m_waiter.then(WAIT_RESULT::TIMED_OUT);
    const auto what = expect_failure<reader::handshake_timeout>();
    EXPECT_NE(what.find("Handshake timeout"), std::string::npos) << what;
}

TEST_F(when_writer_does_not_respond, then_chunk_timeout_names_the_chunk) {
    handshake(100, 1);
    m_waiter.then(WAIT_RESULT::OK).then(WAIT_RESULT::TIMED_OUT);

    reader_t reader(m_region, 100ms);
    try {
        drain(reader, m_waiter);
        FAIL() << "timeout expected";
    } catch(const reader::writer_chunk_timeout& e) {
        EXPECT_EQ(e.m_chunk, 0);
        EXPECT_NE(std::string(e.what()).find("Writer timeout waiting for chunk 0"), std::string::npos) << e.what();
    }
}

TEST_F(when_writer_does_not_respond, then_second_chunk_timeout_names_chunk_1) {
    handshake(100, 2);
    m_waiter.then(WAIT_RESULT::OK);
    m_waiter.then(stage_chunk(0, 0, 50, 1));
    m_waiter.then(WAIT_RESULT::TIMED_OUT);

    const auto what = expect_failure<timeout_error>();
    EXPECT_NE(what.find("Writer timeout waiting for chunk 1"), std::string::npos) << what;
}

struct when_handshake_is_invalid : public reader_over_region {};

TEST_F(when_handshake_is_invalid, then_wrong_state_is_a_protocol_error) {
    word(header::semaphore) = static_cast<int32_t>(SEMAPHORE::PAYLOAD);
    m_waiter.then(WAIT_RESULT::OK);

    const auto what = expect_failure<reader::invalid_handshake_state>();
    EXPECT_NE(what.find("Invalid handshake state"), std::string::npos) << what;
    EXPECT_NE(what.find("PAYLOAD"), std::string::npos) << what;
}

TEST_F(when_handshake_is_invalid, then_still_ready_after_wake_is_rejected) {
    m_waiter.then(WAIT_RESULT::OK);
    expect_failure<reader::invalid_handshake_state>();
}

TEST_F(when_handshake_is_invalid, then_negative_total_size_is_rejected) {
    handshake(-1, 1);
    m_waiter.then(WAIT_RESULT::OK);
    expect_failure<reader::invalid_handshake_values>();
}

TEST_F(when_handshake_is_invalid, then_negative_total_chunks_is_rejected) {
    handshake(10, -1);
    m_waiter.then(WAIT_RESULT::OK);
    expect_failure<reader::invalid_handshake_values>();
}

TEST_F(when_handshake_is_invalid, then_empty_payload_with_chunks_is_rejected) {
    handshake(0, 1);
    m_waiter.then(WAIT_RESULT::OK);
    expect_failure<reader::invalid_handshake_values>();
}

TEST_F(when_handshake_is_invalid, then_size_beyond_declared_chunks_is_rejected) {
    handshake(1008 * 2 + 1, 2);
    m_waiter.then(WAIT_RESULT::OK);
    const auto what = expect_failure<protocol_error>();
    EXPECT_NE(what.find("Invalid handshake values"), std::string::npos) << what;
}

TEST_F(when_handshake_is_invalid, then_rejected_handshake_is_not_acknowledged) {
    handshake(10, 0);
    m_waiter.then(WAIT_RESULT::OK);
    expect_failure<reader::invalid_handshake_values>();
    EXPECT_EQ(m_region.semaphore(), SEMAPHORE::HANDSHAKE);
}

TEST_F(when_handshake_is_invalid, then_exact_fit_is_accepted) {
    handshake(1008 * 2, 2);
    m_waiter.then(WAIT_RESULT::OK);
    m_waiter.then(stage_chunk(0, 0, 1008, 1));
    m_waiter.then(stage_chunk(1, 1008, 1008, 1));

    reader_t reader(m_region, 100ms);
    EXPECT_EQ(drain(reader, m_waiter).size(), 2016u);
}

struct when_chunk_is_invalid : public reader_over_region {};

TEST_F(when_chunk_is_invalid, then_handshake_instead_of_payload_is_rejected) {
    handshake(100, 1);
    m_waiter.then(WAIT_RESULT::OK);
    m_waiter.then([this](const wait_request_t&) {
        word(header::semaphore) = static_cast<int32_t>(SEMAPHORE::HANDSHAKE);
        return WAIT_RESULT::OK;
    });

    const auto what = expect_failure<reader::unexpected_state>();
    EXPECT_NE(what.find("Expected payload header, received HANDSHAKE"), std::string::npos) << what;
}

TEST_F(when_chunk_is_invalid, then_repeated_chunk_index_is_a_sequence_violation) {
    handshake(100, 2);
    m_waiter.then(WAIT_RESULT::OK);
    m_waiter.then(stage_chunk(0, 0, 50, 1));
    m_waiter.then(stage_chunk(0, 50, 50, 1));

    reader_t reader(m_region, 100ms);
    try {
        drain(reader, m_waiter);
        FAIL() << "integrity failure expected";
    } catch(const reader::chunk_sequence_violation& e) {
        EXPECT_EQ(e.m_received, 0);
        EXPECT_EQ(e.m_expected, 1);
        EXPECT_NE(std::string(e.what()).find("Integrity failure for chunk 0 expected 1"), std::string::npos) << e.what();
    }
}

TEST_F(when_chunk_is_invalid, then_skipped_chunk_index_is_a_sequence_violation) {
    handshake(100, 2);
    m_waiter.then(WAIT_RESULT::OK);
    m_waiter.then(stage_chunk(1, 50, 50, 1));
    expect_failure<reader::chunk_sequence_violation>();
}

TEST_F(when_chunk_is_invalid, then_negative_offset_is_rejected) {
    handshake(100, 1);
    m_waiter.then(WAIT_RESULT::OK);
    m_waiter.then(stage_chunk(0, -1, 50, 1));
    const auto what = expect_failure<reader::invalid_chunk_metadata>();
    EXPECT_NE(what.find("Invalid chunk metadata for chunk 0"), std::string::npos) << what;
}

TEST_F(when_chunk_is_invalid, then_zero_size_is_rejected) {
    handshake(100, 1);
    m_waiter.then(WAIT_RESULT::OK);
    m_waiter.then(stage_chunk(0, 0, 0, 1));
    expect_failure<reader::invalid_chunk_metadata>();
}

TEST_F(when_chunk_is_invalid, then_size_beyond_capacity_is_rejected) {
    handshake(2000, 2);
    m_waiter.then(WAIT_RESULT::OK);
    m_waiter.then(stage_chunk(0, 0, 1009, 1));
    expect_failure<reader::invalid_chunk_metadata>();
}

TEST_F(when_chunk_is_invalid, then_chunk_past_total_size_is_rejected) {
    handshake(100, 1);
    m_waiter.then(WAIT_RESULT::OK);
    m_waiter.then(stage_chunk(0, 60, 50, 1));
    expect_failure<protocol_error>();
}

struct when_reader_is_misused : public reader_over_region {};

TEST_F(when_reader_is_misused, then_wait_outcome_before_first_request_is_a_logic_error) {
    reader_t reader(m_region, 100ms);
    EXPECT_THROW(reader.next(WAIT_RESULT::OK), std::logic_error);
}

TEST_F(when_reader_is_misused, then_next_after_failure_is_a_logic_error) {
    m_waiter.then(WAIT_RESULT::TIMED_OUT);
    reader_t reader(m_region, 100ms);
    EXPECT_THROW(drain(reader, m_waiter), reader::handshake_timeout);
    EXPECT_THROW(reader.next(WAIT_RESULT::OK), std::logic_error);
}
