#include <atomic>
#include <limits>

#include <baton_errors.hpp>
#include <baton_region.hpp>
#include <baton_wait.hpp>

namespace baton
{

std::string to_string(SEMAPHORE s)
{
  switch(s) {
    case SEMAPHORE::READY: return "READY";
    case SEMAPHORE::HANDSHAKE: return "HANDSHAKE";
    case SEMAPHORE::PAYLOAD: return "PAYLOAD";
  }
  return std::string("UNKNOWN(").append(std::to_string(static_cast<int32_t>(s))).append(")");
}

std::string header::to_string(const phase_t& p)
{
  if(std::holds_alternative<ready_t>(p)) {
    return baton::to_string(SEMAPHORE::READY);
  }
  if(std::holds_alternative<handshake_t>(p)) {
    return baton::to_string(SEMAPHORE::HANDSHAKE);
  }
  if(std::holds_alternative<payload_t>(p)) {
    return baton::to_string(SEMAPHORE::PAYLOAD);
  }
  return baton::to_string(static_cast<SEMAPHORE>(std::get<unknown_t>(p).m_value));
}

region_t::region_t(uint8_t* data, std::size_t bytes)
  : m_data(data), m_bytes(bytes), m_chunk_capacity(0)
{
  if(bytes % header::word_bytes != 0) {
    throw region::size_alignment(std::source_location::current(), bytes);
  }
  if(bytes <= header::bytes) {
    throw region::too_small(std::source_location::current(), bytes);
  }
  if(bytes > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
    throw region::too_large(std::source_location::current(), bytes);
  }
  if(reinterpret_cast<std::uintptr_t>(data) % std::atomic_ref<int32_t>::required_alignment != 0) {
    throw region::misaligned(std::source_location::current());
  }
  m_chunk_capacity = static_cast<int32_t>(bytes - header::bytes);
}

int32_t region_t::load(std::size_t idx) const noexcept
{
  return std::atomic_ref<int32_t>(*word(idx)).load(std::memory_order_relaxed);
}

void region_t::store(std::size_t idx, int32_t v) noexcept
{
  std::atomic_ref<int32_t>(*word(idx)).store(v, std::memory_order_relaxed);
}

SEMAPHORE region_t::semaphore() const noexcept
{
  return static_cast<SEMAPHORE>(std::atomic_ref<int32_t>(*semaphore_word()).load(std::memory_order_acquire));
}

void region_t::publish(SEMAPHORE s) noexcept
{
  // seq_cst: header words and payload bytes written before this store are visible to a peer that observes it
  std::atomic_ref<int32_t>(*semaphore_word()).store(static_cast<int32_t>(s));
  notify_all(semaphore_word());
}

void region_t::write_handshake(const header::handshake_t& h) noexcept
{
  store(header::total_size, h.m_total_size);
  store(header::total_chunks, h.m_total_chunks);
}

void region_t::write_payload_header(const header::payload_t& p) noexcept
{
  store(header::chunk_index, p.m_chunk_index);
  store(header::chunk_offset, p.m_chunk_offset);
  store(header::chunk_size, p.m_chunk_size);
}

header::phase_t region_t::read_phase() const noexcept
{
  const auto s = semaphore();
  switch(s) {
    case SEMAPHORE::READY:
      return header::ready_t{};
    case SEMAPHORE::HANDSHAKE:
      return header::handshake_t{
        .m_total_size = load(header::total_size),
        .m_total_chunks = load(header::total_chunks)
      };
    case SEMAPHORE::PAYLOAD:
      return header::payload_t{
        .m_chunk_index = load(header::chunk_index),
        .m_chunk_offset = load(header::chunk_offset),
        .m_chunk_size = load(header::chunk_size)
      };
  }
  return header::unknown_t{ .m_value = static_cast<int32_t>(s) };
}

}
