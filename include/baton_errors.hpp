#pragma once

#include <stdexcept>
#include <source_location>
#include <string>
#include <cstring>
#include <cstdint>
#include <cerrno>

namespace baton
{
    inline std::string to_string(const std::source_location& s) {
        return std::string(s.function_name()).append(":").append(std::to_string(s.line()));
    }

    /// @brief malformed region or payload, raised before any state transition
    struct setup_error : public std::runtime_error {
        setup_error(const std::source_location loc, const std::string& what)
        : std::runtime_error(to_string(loc).append(" ").append(what)) {}
    };

    /// @brief the peer did not respond within a single wait's deadline
    struct timeout_error : public std::runtime_error {
        timeout_error(const std::source_location loc, const std::string& what)
        : std::runtime_error(to_string(loc).append(" ").append(what)) {}
    };

    /// @brief the peer (or the memory) produced a value inconsistent with the expected state
    struct protocol_error : public std::runtime_error {
        protocol_error(const std::source_location loc, const std::string& what)
        : std::runtime_error(to_string(loc).append(" ").append(what)) {}
    };

    namespace region
    {
        struct size_alignment : public setup_error {
            size_alignment(const std::source_location loc, std::size_t bytes)
            : setup_error(loc, std::string("Region size ").append(std::to_string(bytes)).append(" is not a multiple of the control word size")) {}
        };

        struct too_small : public setup_error {
            too_small(const std::source_location loc, std::size_t bytes)
            : setup_error(loc, std::string("Region size ").append(std::to_string(bytes)).append(" leaves no room for payload")) {}
        };

        struct too_large : public setup_error {
            too_large(const std::source_location loc, std::size_t bytes)
            : setup_error(loc, std::string("Region size ").append(std::to_string(bytes)).append(" exceeds the addressable chunk size")) {}
        };

        struct misaligned : public setup_error {
            misaligned(const std::source_location loc)
            : setup_error(loc, "Region start is not aligned to the control word") {}
        };
    }

    struct payload_too_large : public setup_error {
        payload_too_large(const std::source_location loc, std::size_t bytes)
        : setup_error(loc, std::string("Payload of ").append(std::to_string(bytes)).append(" bytes can not be declared in a handshake")) {}
    };

    namespace writer
    {
        struct reader_handshake_timeout : public timeout_error {
            reader_handshake_timeout(const std::source_location loc)
            : timeout_error(loc, "Reader handshake timeout") {}
        };

        struct reader_chunk_timeout : public timeout_error {
            int32_t m_chunk;
            int32_t m_last_chunk;

            reader_chunk_timeout(const std::source_location loc, int32_t chunk, int32_t last_chunk)
            : timeout_error(loc, std::string("Reader timeout on chunk ").append(std::to_string(chunk)).append("/").append(std::to_string(last_chunk)))
            , m_chunk(chunk), m_last_chunk(last_chunk) {}
        };
    }

    namespace reader
    {
        struct handshake_timeout : public timeout_error {
            handshake_timeout(const std::source_location loc)
            : timeout_error(loc, "Handshake timeout") {}
        };

        struct writer_chunk_timeout : public timeout_error {
            int32_t m_chunk;

            writer_chunk_timeout(const std::source_location loc, int32_t chunk)
            : timeout_error(loc, std::string("Writer timeout waiting for chunk ").append(std::to_string(chunk)))
            , m_chunk(chunk) {}
        };

        struct invalid_handshake_state : public protocol_error {
            invalid_handshake_state(const std::source_location loc, const std::string& received)
            : protocol_error(loc, std::string("Invalid handshake state, received ").append(received)) {}
        };

        struct invalid_handshake_values : public protocol_error {
            invalid_handshake_values(const std::source_location loc, int32_t total_size, int32_t total_chunks)
            : protocol_error(loc, std::string("Invalid handshake values total_size=").append(std::to_string(total_size)).append(" total_chunks=").append(std::to_string(total_chunks))) {}
        };

        struct unexpected_state : public protocol_error {
            unexpected_state(const std::source_location loc, const std::string& received)
            : protocol_error(loc, std::string("Expected payload header, received ").append(received)) {}
        };

        /// chunks arrived out of order; either party may be at fault
        struct chunk_sequence_violation : public protocol_error {
            int32_t m_received;
            int32_t m_expected;

            chunk_sequence_violation(const std::source_location loc, int32_t received, int32_t expected)
            : protocol_error(loc, std::string("Integrity failure for chunk ").append(std::to_string(received)).append(" expected ").append(std::to_string(expected)))
            , m_received(received), m_expected(expected) {}
        };

        struct invalid_chunk_metadata : public protocol_error {
            invalid_chunk_metadata(const std::source_location loc, int32_t chunk)
            : protocol_error(loc, std::string("Invalid chunk metadata for chunk ").append(std::to_string(chunk))) {}
        };
    }

    namespace configure
    {
        struct unsupported_option : public std::runtime_error {
            template <typename O>
            unsupported_option(const std::source_location loc, O option)
            : std::runtime_error(to_string(loc).append(" unsupported option:").append(option)) {}
        };

        struct impossible_option_value : public std::runtime_error {
            template <typename O>
            impossible_option_value(const std::source_location loc, O option)
            : std::runtime_error(to_string(loc).append(" impossible value of option:").append(option)) {}
        };

        struct not_a_number_option_value : public impossible_option_value {
            template <typename O>
            not_a_number_option_value(const std::source_location loc, O option)
            : impossible_option_value(loc, std::string("format \"").append(option).append("={number}\"")) {}
        };
    }

    namespace os
    {
        struct errno_error : public std::runtime_error
        {
          int m_errno;

          errno_error(std::source_location loc, const char* what)
          : errno_error(loc, errno, what) {}

          errno_error(std::source_location loc, int err, const char* what)
          : std::runtime_error(to_string(loc).append(" errno:\"").append((const char*)strerror(err)).append("\":").append(std::to_string(err)).append(" ").append(what))
          , m_errno(err) {}
        };
    }
}
