#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace baton
{
    /// @brief outcome of a wait; a word that already differs from the expected value is reported as OK
    enum class WAIT_RESULT {
        OK,
        TIMED_OUT
    };

    /// @brief a state machine asks its driver to block until *m_target != m_expected or m_timeout elapses
    struct wait_request_t {
        int32_t* m_target = nullptr;
        int32_t m_expected = 0;
        std::chrono::milliseconds m_timeout{0};
    };

    /// @brief blocking form of the wait primitive
    struct waiter_t
    {
        virtual ~waiter_t() = default;
        virtual WAIT_RESULT wait(const wait_request_t& request) = 0;
    };

    /// @brief a wait in progress, started by async_waiter_t
    struct pending_wait_t
    {
        virtual ~pending_wait_t() = default;

        /// never blocks
        /// @return nullopt while the wait is not resolved yet
        virtual std::optional<WAIT_RESULT> poll() = 0;
    };

    /// @brief suspending form of the wait primitive; the caller's scheduler polls the pending wait
    struct async_waiter_t
    {
        virtual ~async_waiter_t() = default;
        virtual std::unique_ptr<pending_wait_t> start(const wait_request_t& request) = 0;
    };

    /// @brief wakes every thread (in any process mapping the same memory) waiting on the word
    void notify_all(int32_t* word) noexcept;

    /// @brief blocks with futex(FUTEX_WAIT), the word may live in memory shared between processes
    struct futex_waiter_t final : public waiter_t
    {
        /// @throws os::errno_error when the futex call fails for a reason other than a timeout or interruption
        WAIT_RESULT wait(const wait_request_t& request) override;
    };

    /// @brief resolves a wait by comparing the word against the deadline fixed at start();
    /// a pending wait gets no wake-up when the word changes, the caller's scheduler
    /// must call poll() again on its own until the wait resolves
    struct futex_async_waiter_t final : public async_waiter_t
    {
        std::unique_ptr<pending_wait_t> start(const wait_request_t& request) override;
    };
}
