#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include <baton_region.hpp>
#include <baton_wait.hpp>

namespace baton
{
    /// @brief reader side of a transfer, mirrors writer_t and validates every header value
    /// before it trusts it; acknowledges the handshake and each chunk by publishing READY
    struct reader_t final
    {
        using result_t = std::vector<uint8_t>;
        using step_t = std::variant<wait_request_t, result_t>;

        reader_t(region_t region, std::chrono::milliseconds timeout);

        /// @param answer nullopt on the first call, then the outcome of the requested wait
        /// @throws reader::handshake_timeout, reader::writer_chunk_timeout and the reader:: protocol errors
        step_t next(std::optional<WAIT_RESULT> answer);

    private:
        enum class STATE {
            INIT,
            HANDSHAKE,
            PAYLOAD,
            DONE
        };

        step_t accept_handshake();
        step_t accept_chunk();
        step_t await_chunk_or_finish();
        wait_request_t wait_while_ready() const;

        region_t m_region;
        std::chrono::milliseconds m_timeout;

        int32_t m_total_size = 0;
        int32_t m_total_chunks = 0;
        int32_t m_next_chunk = 0; /// number of chunks consumed so far

        result_t m_data;
        STATE m_state = STATE::INIT;
    };
}
