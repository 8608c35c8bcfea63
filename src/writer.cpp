#include <algorithm>
#include <cstring>
#include <exception>
#include <limits>
#include <stdexcept>

#include <baton_errors.hpp>
#include <baton_writer.hpp>

namespace baton
{

struct writer_t::release_on_exit_t
{
  writer_t& m_writer;
  int m_count = std::uncaught_exceptions();

  release_on_exit_t(writer_t& w) : m_writer(w) {}
  release_on_exit_t(const release_on_exit_t&) = delete;
  release_on_exit_t& operator=(const release_on_exit_t&) = delete;

  ~release_on_exit_t()
  {
    if(m_count != std::uncaught_exceptions() || m_writer.m_state == STATE::DONE) {
      m_writer.release();
    }
  }
};

writer_t::writer_t(std::span<const uint8_t> payload, region_t region, std::chrono::milliseconds timeout)
  : m_payload(payload), m_region(region), m_timeout(timeout)
{
  if(payload.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
    throw payload_too_large(std::source_location::current(), payload.size());
  }
  m_total_size = static_cast<int32_t>(payload.size());
  m_total_chunks = static_cast<int32_t>(chunks_for(m_total_size, m_region.chunk_capacity()));
}

writer_t::writer_t(writer_t&& other) noexcept
  : m_payload(other.m_payload)
  , m_region(other.m_region)
  , m_timeout(other.m_timeout)
  , m_total_size(other.m_total_size)
  , m_total_chunks(other.m_total_chunks)
  , m_next_chunk(other.m_next_chunk)
  , m_state(other.m_state)
  , m_engaged(other.m_engaged)
{
  other.m_state = STATE::DONE;
  other.m_engaged = false;
}

writer_t::~writer_t()
{
  // abandoned mid transfer: the reader must not see a stale HANDSHAKE/PAYLOAD
  release();
}

void writer_t::release() noexcept
{
  m_state = STATE::DONE;
  if(m_engaged) {
    m_engaged = false;
    m_region.publish(SEMAPHORE::READY);
  }
}

wait_request_t writer_t::wait_while(SEMAPHORE s) const
{
  return wait_request_t{
    .m_target = m_region.semaphore_word(),
    .m_expected = static_cast<int32_t>(s),
    .m_timeout = m_timeout
  };
}

wait_request_t writer_t::stage_chunk()
{
  const int32_t capacity = m_region.chunk_capacity();
  const int64_t offset = int64_t(m_next_chunk) * capacity;
  const int32_t size = static_cast<int32_t>(std::min<int64_t>(capacity, m_total_size - offset));

  // the reader released the payload area with its last READY, nobody else touches it until PAYLOAD
  std::memcpy(m_region.payload().data(), m_payload.data() + offset, static_cast<std::size_t>(size));

  m_region.write_payload_header(header::payload_t{
    .m_chunk_index = m_next_chunk,
    .m_chunk_offset = static_cast<int32_t>(offset),
    .m_chunk_size = size
  });
  m_region.publish(SEMAPHORE::PAYLOAD);

  ++m_next_chunk;
  m_state = STATE::PAYLOAD;
  return wait_while(SEMAPHORE::PAYLOAD);
}

writer_t::step_t writer_t::next(std::optional<WAIT_RESULT> answer)
{
  release_on_exit_t guard(*this);
  return advance(answer);
}

writer_t::step_t writer_t::advance(std::optional<WAIT_RESULT> answer)
{
  switch(m_state) {
    case STATE::INIT:
      if(answer) {
        throw std::logic_error("writer_t::next: no wait was requested yet");
      }
      m_region.write_handshake(header::handshake_t{
        .m_total_size = m_total_size,
        .m_total_chunks = m_total_chunks
      });
      m_engaged = true;
      m_region.publish(SEMAPHORE::HANDSHAKE);
      m_state = STATE::HANDSHAKE;
      return wait_while(SEMAPHORE::HANDSHAKE);

    case STATE::HANDSHAKE:
      if(!answer) {
        throw std::logic_error("writer_t::next: outcome of the handshake wait is missing");
      }
      if(*answer == WAIT_RESULT::TIMED_OUT) {
        throw writer::reader_handshake_timeout(std::source_location::current());
      }
      break;

    case STATE::PAYLOAD:
      if(!answer) {
        throw std::logic_error("writer_t::next: outcome of the chunk wait is missing");
      }
      if(*answer == WAIT_RESULT::TIMED_OUT) {
        throw writer::reader_chunk_timeout(std::source_location::current(), m_next_chunk - 1, m_total_chunks - 1);
      }
      break;

    case STATE::DONE:
      throw std::logic_error("writer_t::next: transfer is over");
  }

  if(m_next_chunk < m_total_chunks) {
    return stage_chunk();
  }

  m_state = STATE::DONE;
  return completed_t{ .m_total_size = m_total_size, .m_total_chunks = m_total_chunks };
}

}
