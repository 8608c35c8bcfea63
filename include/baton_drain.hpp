#pragma once

#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include <baton_config.hpp>
#include <baton_reader.hpp>
#include <baton_region.hpp>
#include <baton_wait.hpp>
#include <baton_writer.hpp>

namespace baton
{
    /// @brief runs a state machine to completion with the blocking form of the wait primitive
    /// @tparam MACHINE writer_t or reader_t
    template <typename MACHINE>
    typename MACHINE::result_t drain(MACHINE& machine, waiter_t& waiter)
    {
        auto step = machine.next(std::nullopt);
        while(const auto* request = std::get_if<wait_request_t>(&step)) {
            step = machine.next(waiter.wait(*request));
        }
        return std::get<typename MACHINE::result_t>(std::move(step));
    }

    /// @brief runs a state machine with the suspending form of the wait primitive;
    /// the caller's scheduler calls poll() until it reports DONE.
    /// Destroying an unfinished drain abandons the machine.
    template <typename MACHINE>
    struct async_drain_t final
    {
        enum class STATUS {
            WAIT, /// a wait is pending, poll again later
            DONE  /// result() is available
        };

        async_drain_t(MACHINE machine, async_waiter_t& waiter)
            : m_machine(std::move(machine)), m_waiter(waiter)
        {
        }

        /// advances every step whose wait has already resolved, never blocks
        /// @throws whatever the machine throws, the drain is DONE afterwards
        STATUS poll()
        {
            if(m_result) {
                return STATUS::DONE;
            }
            if(m_failed) {
                throw std::logic_error("async_drain_t::poll: transfer failed");
            }

            try {
                std::optional<WAIT_RESULT> answer;
                if(m_pending) {
                    answer = m_pending->poll();
                    if(!answer) {
                        return STATUS::WAIT;
                    }
                    m_pending.reset();
                }

                while(true) {
                    auto step = m_machine.next(answer);
                    if(auto* request = std::get_if<wait_request_t>(&step)) {
                        m_pending = m_waiter.start(*request);
                        answer = m_pending->poll();
                        if(!answer) {
                            return STATUS::WAIT;
                        }
                        m_pending.reset();
                        continue;
                    }
                    m_result.emplace(std::get<typename MACHINE::result_t>(std::move(step)));
                    return STATUS::DONE;
                }
            }
            catch(...) {
                m_pending.reset();
                m_failed = true;
                throw;
            }
        }

        bool done() const { return m_result.has_value(); }

        typename MACHINE::result_t& result()
        {
            if(!m_result) {
                throw std::logic_error("async_drain_t::result: transfer is not complete");
            }
            return *m_result;
        }

    private:
        MACHINE m_machine;
        async_waiter_t& m_waiter;
        std::unique_ptr<pending_wait_t> m_pending;
        std::optional<typename MACHINE::result_t> m_result;
        bool m_failed = false;
    };

    /// blocking transfer over futex_waiter_t
    writer_t::completed_t write_sync(std::span<const uint8_t> payload, region_t region, const options_t& options = options_t{});
    std::vector<uint8_t> read_sync(region_t region, const options_t& options = options_t{});

    /// suspending transfer over futex_async_waiter_t; the payload must outlive the returned drain
    std::unique_ptr<async_drain_t<writer_t>> write_async(std::span<const uint8_t> payload, region_t region, const options_t& options = options_t{});
    std::unique_ptr<async_drain_t<reader_t>> read_async(region_t region, const options_t& options = options_t{});
}
