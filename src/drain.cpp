#include <baton_drain.hpp>

namespace
{
  baton::async_waiter_t& shared_async_waiter()
  {
    // stateless, every pending wait carries its own request and deadline
    static baton::futex_async_waiter_t waiter;
    return waiter;
  }
}

namespace baton
{

writer_t::completed_t write_sync(std::span<const uint8_t> payload, region_t region, const options_t& options)
{
  futex_waiter_t waiter;
  writer_t writer(payload, region, options.m_timeout);
  return drain(writer, waiter);
}

std::vector<uint8_t> read_sync(region_t region, const options_t& options)
{
  futex_waiter_t waiter;
  reader_t reader(region, options.m_timeout);
  return drain(reader, waiter);
}

std::unique_ptr<async_drain_t<writer_t>> write_async(std::span<const uint8_t> payload, region_t region, const options_t& options)
{
  return std::make_unique<async_drain_t<writer_t>>(writer_t(payload, region, options.m_timeout), shared_async_waiter());
}

std::unique_ptr<async_drain_t<reader_t>> read_async(region_t region, const options_t& options)
{
  return std::make_unique<async_drain_t<reader_t>>(reader_t(region, options.m_timeout), shared_async_waiter());
}

}
