#include <gtest/gtest.h>

#include <atomic>
#include <exception>
#include <numeric>
#include <thread>
#include <vector>

#include <baton_drain.hpp>
#include <baton_errors.hpp>
#include <baton_shared_mem_linux.hpp>

using namespace baton;
using namespace std::chrono_literals;

namespace
{
    std::vector<uint8_t> make_payload(std::size_t len)
    {
        std::vector<uint8_t> ret(len);
        std::iota(ret.begin(), ret.end(), uint8_t(1));
        return ret;
    }
}

struct when_peers_run_in_two_threads : public testing::Test
{
    shared_mem::memfd_region_t m_memory{1024};
    region_t m_region = m_memory.region();
    options_t m_options{ .m_timeout = 2000ms };

    /// runs read_sync on a separate thread and write_sync on this one
    std::vector<uint8_t> transfer(const std::vector<uint8_t>& payload)
    {
        std::vector<uint8_t> received;
        std::exception_ptr reader_failure;

        std::thread reader([&]() {
            try {
                received = read_sync(m_region, m_options);
            } catch(...) {
                reader_failure = std::current_exception();
            }
        });

        std::exception_ptr writer_failure;
        try {
            const auto completed = write_sync(payload, m_region, m_options);
            EXPECT_EQ(completed.m_total_size, int32_t(payload.size()));
            EXPECT_EQ(completed.m_total_chunks, chunks_for(int64_t(payload.size()), m_region.chunk_capacity()));
        } catch(...) {
            writer_failure = std::current_exception();
        }
        reader.join();

        if(writer_failure) {
            std::rethrow_exception(writer_failure);
        }
        if(reader_failure) {
            std::rethrow_exception(reader_failure);
        }
        return received;
    }
};

TEST_F(when_peers_run_in_two_threads, then_payloads_of_any_length_arrive_intact) {
    const int32_t p = m_region.chunk_capacity();
    for(const int32_t len : {0, 1, p - 1, p, p + 1, 5 * p + 3}) {
        const auto payload = make_payload(std::size_t(len));
        EXPECT_EQ(transfer(payload), payload) << "length " << len;
        EXPECT_EQ(m_region.semaphore(), SEMAPHORE::READY) << "length " << len;
    }
}

TEST_F(when_peers_run_in_two_threads, then_region_is_reused_by_consecutive_transfers) {
    const auto first = make_payload(3000);
    const auto second = std::vector<uint8_t>(17, 0xEE);
    EXPECT_EQ(transfer(first), first);
    EXPECT_EQ(transfer(second), second);
}

struct when_peer_is_missing : public testing::Test
{
    std::vector<uint8_t> m_memory = std::vector<uint8_t>(256);
    region_t m_region{m_memory.data(), m_memory.size()};
    options_t m_options{ .m_timeout = 50ms };
};

TEST_F(when_peer_is_missing, then_lonely_reader_times_out) {
    EXPECT_THROW(read_sync(m_region, m_options), reader::handshake_timeout);
    EXPECT_EQ(m_region.semaphore(), SEMAPHORE::READY);
}

TEST_F(when_peer_is_missing, then_lonely_writer_times_out_and_resets_region) {
    const auto payload = make_payload(10);
    EXPECT_THROW(write_sync(payload, m_region, m_options), writer::reader_handshake_timeout);
    EXPECT_EQ(m_region.semaphore(), SEMAPHORE::READY);
}

TEST_F(when_peer_is_missing, then_async_reader_times_out_on_poll) {
    auto drain = read_async(m_region, m_options);
    EXPECT_EQ(drain->poll(), async_drain_t<reader_t>::STATUS::WAIT);

    std::this_thread::sleep_for(80ms);
    EXPECT_THROW(drain->poll(), reader::handshake_timeout);
    EXPECT_THROW(drain->poll(), std::logic_error);
    EXPECT_FALSE(drain->done());
}

struct when_peers_share_one_thread : public testing::Test
{
    std::vector<uint8_t> m_memory = std::vector<uint8_t>(64);
    region_t m_region{m_memory.data(), m_memory.size()};
};

TEST_F(when_peers_share_one_thread, then_interleaved_polls_complete_the_transfer) {
    using writer_status = async_drain_t<writer_t>::STATUS;
    using reader_status = async_drain_t<reader_t>::STATUS;

    const auto payload = make_payload(std::size_t(m_region.chunk_capacity()) * 4 + 7);
    auto writer = write_async(payload, m_region);
    auto reader = read_async(m_region);

    // every poll round advances both peers by at least one step
    for(int round = 0; round < 100 && !(writer->done() && reader->done()); ++round) {
        writer->poll();
        reader->poll();
    }

    ASSERT_EQ(writer->poll(), writer_status::DONE);
    ASSERT_EQ(reader->poll(), reader_status::DONE);
    EXPECT_EQ(reader->result(), payload);
    EXPECT_EQ(writer->result().m_total_chunks, 5);
    EXPECT_EQ(m_region.semaphore(), SEMAPHORE::READY);
}

TEST_F(when_peers_share_one_thread, then_result_before_completion_is_a_logic_error) {
    auto reader = read_async(m_region);
    EXPECT_EQ(reader->poll(), async_drain_t<reader_t>::STATUS::WAIT);
    EXPECT_THROW(reader->result(), std::logic_error);
}

TEST_F(when_peers_share_one_thread, then_abandoned_writer_resets_region) {
    const auto payload = make_payload(100);
    auto writer = write_async(payload, m_region);
    auto reader = read_async(m_region);

    EXPECT_EQ(writer->poll(), async_drain_t<writer_t>::STATUS::WAIT);
    EXPECT_EQ(m_region.semaphore(), SEMAPHORE::HANDSHAKE);
    EXPECT_EQ(reader->poll(), async_drain_t<reader_t>::STATUS::WAIT);
    EXPECT_EQ(writer->poll(), async_drain_t<writer_t>::STATUS::WAIT);
    EXPECT_EQ(m_region.semaphore(), SEMAPHORE::PAYLOAD);

    writer.reset();
    EXPECT_EQ(m_region.semaphore(), SEMAPHORE::READY);
}

TEST_F(when_peers_share_one_thread, then_pending_wait_resolves_on_the_next_poll) {
    futex_async_waiter_t waiter;
    auto pending = waiter.start(wait_request_t{
        .m_target = m_region.semaphore_word(),
        .m_expected = static_cast<int32_t>(SEMAPHORE::READY),
        .m_timeout = 1000ms
    });
    EXPECT_FALSE(pending->poll().has_value());

    // a store without notify: nothing wakes the pending wait, only the caller's poll observes it
    std::atomic_ref<int32_t>(*m_region.semaphore_word()).store(static_cast<int32_t>(SEMAPHORE::HANDSHAKE));
    const auto result = pending->poll();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, WAIT_RESULT::OK);
}
