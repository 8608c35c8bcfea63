#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>

#include <baton_region.hpp>
#include <baton_wait.hpp>

namespace baton
{
    /// @brief writer side of a transfer: HANDSHAKE followed by one PAYLOAD step per chunk.
    ///
    /// The machine never blocks. Each call to next() performs the stores of one step
    /// and returns the wait its driver has to perform before calling next() again
    /// with the outcome of that wait.
    ///
    /// Once the handshake was published the region is reset to READY when the transfer
    /// finishes, fails, or the writer is destroyed before it finished.
    struct writer_t final
    {
        struct completed_t {
            int32_t m_total_size = 0;
            int32_t m_total_chunks = 0;
        };

        using result_t = completed_t;
        using step_t = std::variant<wait_request_t, completed_t>;

        /// the payload is not copied, it must outlive the writer
        /// @throws payload_too_large
        writer_t(std::span<const uint8_t> payload, region_t region, std::chrono::milliseconds timeout);
        ~writer_t();

        writer_t(const writer_t&) = delete;
        writer_t& operator=(const writer_t&) = delete;
        writer_t(writer_t&& other) noexcept;
        writer_t& operator=(writer_t&&) = delete;

        /// @param answer nullopt on the first call, then the outcome of the requested wait
        /// @throws writer::reader_handshake_timeout, writer::reader_chunk_timeout
        step_t next(std::optional<WAIT_RESULT> answer);

        int32_t total_size() const { return m_total_size; }
        int32_t total_chunks() const { return m_total_chunks; }

    private:
        enum class STATE {
            INIT,
            HANDSHAKE,
            PAYLOAD,
            DONE
        };

        /// runs at the end of every next() call, resets the region when the machine
        /// finished or an exception leaves next()
        struct release_on_exit_t;

        step_t advance(std::optional<WAIT_RESULT> answer);
        wait_request_t stage_chunk();
        wait_request_t wait_while(SEMAPHORE s) const;
        void release() noexcept;

        std::span<const uint8_t> m_payload;
        region_t m_region;
        std::chrono::milliseconds m_timeout;

        int32_t m_total_size = 0;
        int32_t m_total_chunks = 0;
        int32_t m_next_chunk = 0; /// index of the chunk staged next; the staged one is m_next_chunk - 1

        STATE m_state = STATE::INIT;
        bool m_engaged = false; /// the handshake was published and READY was not restored yet
    };
}
