#pragma once

#include <cstdint>
#include <cstddef>
#include <span>
#include <string>
#include <variant>

namespace baton
{
    /// @brief value of the control word 0, drives both sides of a transfer
    /// - READY the region is idle or the last staged chunk was consumed
    /// - HANDSHAKE writer published total size and chunk count
    /// - PAYLOAD writer staged one chunk, reader must consume it before the payload area is overwritten
    enum class SEMAPHORE : int32_t {
        READY = 0,
        HANDSHAKE = 1,
        PAYLOAD = 2
    };

    /// @return "READY", "HANDSHAKE", "PAYLOAD" or "UNKNOWN(<n>)" for a value outside of the enum
    std::string to_string(SEMAPHORE s);

    /// @brief the header is 4 int32 words; words 1..3 are interpreted according to the semaphore
    namespace header
    {
        constexpr std::size_t word_bytes = sizeof(int32_t);
        constexpr std::size_t words = 4;
        constexpr std::size_t bytes = word_bytes * words;

        constexpr std::size_t semaphore = 0;

        // HANDSHAKE phase
        constexpr std::size_t total_size = 1;
        constexpr std::size_t total_chunks = 2;

        // PAYLOAD phase
        constexpr std::size_t chunk_index = 1;
        constexpr std::size_t chunk_offset = 2;
        constexpr std::size_t chunk_size = 3;

        struct ready_t {};

        struct handshake_t {
            int32_t m_total_size = 0;
            int32_t m_total_chunks = 0;
        };

        struct payload_t {
            int32_t m_chunk_index = 0;
            int32_t m_chunk_offset = 0;
            int32_t m_chunk_size = 0;
        };

        struct unknown_t {
            int32_t m_value = 0;
        };

        /// header words decoded according to the semaphore value observed at the time of the read
        using phase_t = std::variant<ready_t, handshake_t, payload_t, unknown_t>;

        /// @return name of the semaphore value the phase was decoded from
        std::string to_string(const phase_t& p);
    }

    /// @return number of chunks needed to transfer total_size bytes, 0 for an empty payload
    constexpr int64_t chunks_for(int64_t total_size, int64_t chunk_capacity) {
        return total_size == 0 ? 0 : (total_size + chunk_capacity - 1) / chunk_capacity;
    }

    /// @brief a view over a shared memory region: header followed by a payload area;
    /// the region is not owned, the caller keeps it alive for the lifetime of the view
    struct region_t final
    {
        /// validates the range before any header access
        /// @throws region::size_alignment, region::too_small, region::too_large, region::misaligned
        region_t(uint8_t* data, std::size_t bytes);

        std::size_t size() const { return m_bytes; }

        /// @return payload area size, the maximum chunk size for the region lifetime
        int32_t chunk_capacity() const { return m_chunk_capacity; }

        SEMAPHORE semaphore() const noexcept;

        /// stores the semaphore and wakes every waiter on it
        void publish(SEMAPHORE s) noexcept;

        void write_handshake(const header::handshake_t& h) noexcept;
        void write_payload_header(const header::payload_t& p) noexcept;

        header::phase_t read_phase() const noexcept;

        std::span<uint8_t> payload() const noexcept {
            return std::span<uint8_t>(m_data + header::bytes, static_cast<std::size_t>(m_chunk_capacity));
        }

        /// address of the control word, the wait primitive watches it
        int32_t* semaphore_word() const noexcept { return word(header::semaphore); }

    private:
        int32_t* word(std::size_t idx) const noexcept {
            return reinterpret_cast<int32_t*>(m_data) + idx;
        }

        int32_t load(std::size_t idx) const noexcept;
        void store(std::size_t idx, int32_t v) noexcept;

        uint8_t* m_data;
        std::size_t m_bytes;
        int32_t m_chunk_capacity;
    };
}
