#pragma once

#include <deque>
#include <functional>
#include <vector>

#include <baton_wait.hpp>

namespace baton
{
    namespace mock
    {
        /// @brief plays the peer in a single thread: every wait runs the next scripted reaction,
        /// the reaction may mutate the region the way the peer would and returns the wait outcome
        struct scripted_waiter_t : public waiter_t
        {
            using reaction_t = std::function<WAIT_RESULT(const wait_request_t&)>;

            std::deque<reaction_t> m_script;
            std::vector<wait_request_t> m_requests;
            WAIT_RESULT m_default = WAIT_RESULT::TIMED_OUT; // when the script is exhausted

            scripted_waiter_t& then(reaction_t r)
            {
                m_script.emplace_back(std::move(r));
                return *this;
            }

            scripted_waiter_t& then(WAIT_RESULT r)
            {
                return then([r](const wait_request_t&) { return r; });
            }

            WAIT_RESULT wait(const wait_request_t& request) override
            {
                m_requests.push_back(request);
                if(m_script.empty()) {
                    return m_default;
                }
                auto reaction = std::move(m_script.front());
                m_script.pop_front();
                return reaction(request);
            }
        };
    }
}
