#include <cstring>
#include <stdexcept>

#include <baton_errors.hpp>
#include <baton_reader.hpp>

namespace
{
  bool is_valid_handshake(const baton::header::handshake_t& h, int32_t chunk_capacity)
  {
    if(h.m_total_size < 0 || h.m_total_chunks < 0) {
      return false;
    }
    if(h.m_total_size == 0 && h.m_total_chunks != 0) {
      return false;
    }
    return int64_t(h.m_total_size) <= int64_t(h.m_total_chunks) * chunk_capacity;
  }

  bool is_valid_chunk(const baton::header::payload_t& p, int32_t chunk_capacity, int32_t total_size)
  {
    return p.m_chunk_offset >= 0
      && p.m_chunk_size > 0
      && p.m_chunk_size <= chunk_capacity
      && int64_t(p.m_chunk_offset) + p.m_chunk_size <= total_size;
  }
}

namespace baton
{

reader_t::reader_t(region_t region, std::chrono::milliseconds timeout)
  : m_region(region), m_timeout(timeout)
{
}

wait_request_t reader_t::wait_while_ready() const
{
  return wait_request_t{
    .m_target = m_region.semaphore_word(),
    .m_expected = static_cast<int32_t>(SEMAPHORE::READY),
    .m_timeout = m_timeout
  };
}

reader_t::step_t reader_t::next(std::optional<WAIT_RESULT> answer)
{
  switch(m_state) {
    case STATE::INIT:
      if(answer) {
        throw std::logic_error("reader_t::next: no wait was requested yet");
      }
      m_state = STATE::HANDSHAKE;
      return wait_while_ready();

    case STATE::HANDSHAKE:
      if(!answer) {
        throw std::logic_error("reader_t::next: outcome of the handshake wait is missing");
      }
      if(*answer == WAIT_RESULT::TIMED_OUT) {
        m_state = STATE::DONE;
        throw reader::handshake_timeout(std::source_location::current());
      }
      return accept_handshake();

    case STATE::PAYLOAD:
      if(!answer) {
        throw std::logic_error("reader_t::next: outcome of the chunk wait is missing");
      }
      if(*answer == WAIT_RESULT::TIMED_OUT) {
        m_state = STATE::DONE;
        throw reader::writer_chunk_timeout(std::source_location::current(), m_next_chunk);
      }
      return accept_chunk();

    case STATE::DONE:
      break;
  }
  throw std::logic_error("reader_t::next: transfer is over");
}

reader_t::step_t reader_t::accept_handshake()
{
  // any failure below ends the transfer for this reader
  m_state = STATE::DONE;

  const auto phase = m_region.read_phase();
  const auto* h = std::get_if<header::handshake_t>(&phase);
  if(!h) {
    throw reader::invalid_handshake_state(std::source_location::current(), header::to_string(phase));
  }
  if(!is_valid_handshake(*h, m_region.chunk_capacity())) {
    throw reader::invalid_handshake_values(std::source_location::current(), h->m_total_size, h->m_total_chunks);
  }

  m_total_size = h->m_total_size;
  m_total_chunks = h->m_total_chunks;
  m_data.assign(static_cast<std::size_t>(m_total_size), 0);

  // acknowledges the handshake and arms the wait for the first chunk
  m_region.publish(SEMAPHORE::READY);
  return await_chunk_or_finish();
}

reader_t::step_t reader_t::accept_chunk()
{
  m_state = STATE::DONE;

  const auto phase = m_region.read_phase();
  const auto* p = std::get_if<header::payload_t>(&phase);
  if(!p) {
    throw reader::unexpected_state(std::source_location::current(), header::to_string(phase));
  }
  if(p->m_chunk_index != m_next_chunk) {
    throw reader::chunk_sequence_violation(std::source_location::current(), p->m_chunk_index, m_next_chunk);
  }
  if(!is_valid_chunk(*p, m_region.chunk_capacity(), m_total_size)) {
    throw reader::invalid_chunk_metadata(std::source_location::current(), m_next_chunk);
  }

  std::memcpy(m_data.data() + p->m_chunk_offset, m_region.payload().data(), static_cast<std::size_t>(p->m_chunk_size));
  ++m_next_chunk;

  // the writer may overwrite the payload area from now on
  m_region.publish(SEMAPHORE::READY);
  return await_chunk_or_finish();
}

reader_t::step_t reader_t::await_chunk_or_finish()
{
  if(m_next_chunk < m_total_chunks) {
    m_state = STATE::PAYLOAD;
    return wait_while_ready();
  }
  m_state = STATE::DONE;
  return std::move(m_data);
}

}
