#include <atomic>
#include <cerrno>
#include <climits>
#include <iostream>

#include <time.h>
#include <unistd.h>
#include <linux/futex.h>
#include <sys/syscall.h>

#include <baton_errors.hpp>
#include <baton_wait.hpp>

namespace
{
  int32_t load_word(int32_t* word)
  {
    return std::atomic_ref<int32_t>(*word).load(std::memory_order_acquire);
  }

  timespec to_timespec(std::chrono::steady_clock::duration d)
  {
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();
    timespec ts;
    ts.tv_sec = static_cast<time_t>(ns / 1000000000);
    ts.tv_nsec = static_cast<long>(ns % 1000000000);
    return ts;
  }

  struct futex_pending_wait_t final : public baton::pending_wait_t
  {
    baton::wait_request_t m_request;
    std::chrono::steady_clock::time_point m_deadline;

    futex_pending_wait_t(const baton::wait_request_t& request)
      : m_request(request), m_deadline(std::chrono::steady_clock::now() + request.m_timeout)
    {
    }

    std::optional<baton::WAIT_RESULT> poll() override
    {
      if(load_word(m_request.m_target) != m_request.m_expected) {
        return baton::WAIT_RESULT::OK;
      }
      if(std::chrono::steady_clock::now() >= m_deadline) {
        return baton::WAIT_RESULT::TIMED_OUT;
      }
      return std::nullopt;
    }
  };
}

namespace baton
{

void notify_all(int32_t* word) noexcept
{
  // not FUTEX_WAKE_PRIVATE: the peer may be another process mapping the same memfd
  if(syscall(SYS_futex, word, FUTEX_WAKE, INT_MAX, nullptr, nullptr, 0) == -1) {
    std::cerr << __FUNCTION__ << " FUTEX_WAKE errno " << errno << std::endl;
  }
}

WAIT_RESULT futex_waiter_t::wait(const wait_request_t& request)
{
  const auto deadline = std::chrono::steady_clock::now() + request.m_timeout;

  // futex may return on a spurious wake or a signal, the word decides
  while(load_word(request.m_target) == request.m_expected) {
    const auto now = std::chrono::steady_clock::now();
    if(now >= deadline) {
      return WAIT_RESULT::TIMED_OUT;
    }

    const timespec remaining = to_timespec(deadline - now);
    if(syscall(SYS_futex, request.m_target, FUTEX_WAIT, request.m_expected, &remaining, nullptr, 0) == -1) {
      switch(errno) {
        case EAGAIN: // the word changed before the kernel checked it
        case EINTR:
        case ETIMEDOUT: // the loop condition re-checks the word and the deadline
          break;
        default:
          throw os::errno_error(std::source_location::current(), "futex FUTEX_WAIT");
      }
    }
  }
  return WAIT_RESULT::OK;
}

std::unique_ptr<pending_wait_t> futex_async_waiter_t::start(const wait_request_t& request)
{
  return std::make_unique<futex_pending_wait_t>(request);
}

}
