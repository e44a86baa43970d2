/***
    This file is part of vlcrc
    Copyright (C) 2014-2025  Johannes Pohl

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
***/

#pragma once

// local headers
#include "client_settings.hpp"
#include "common/error_code.hpp"
#include "common/rc_error.hpp"

// 3rd party headers
#include <aixlog.hpp>

// standard headers
#include <algorithm>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>


namespace vlcrc
{

namespace detail
{
/// @return @p value as printable text
template <typename T>
std::string describe(const T& value)
{
    std::ostringstream os;
    os << std::boolalpha << value;
    return os.str();
}
} // namespace detail


/// Change a state of the player that is reported with a delay
/**
 * The player's query commands may return a stale value for a short, variable
 * time after a state changing command. So @p command is issued, the state is
 * read back with @p query and @p command is issued again as long as
 * @p converged rejects the observed value.
 *
 * Replies that can not be parsed are treated like a mismatch, all other
 * errors are returned immediately.
 *
 * @param policy max number of attempts, pause before reading back, overall deadline
 * @param what description of the change, used in logs and errors
 * @param command issues the state changing command, returns ErrorCode
 * @param query reads the current state, returns ErrorOr<T>
 * @param converged predicate on T, true if the observed state is the requested one
 * @return no error on convergence, not_converged with the last observed value if the budget is exhausted
 */
template <typename Command, typename Query, typename Predicate>
ErrorCode converge(const ClientSettings::Convergence& policy, const std::string& what, Command&& command, Query&& query, Predicate&& converged)
{
    static constexpr auto log_tag = "Converge";
    const auto start = std::chrono::steady_clock::now();
    const size_t max_attempts = std::max<size_t>(policy.max_attempts, 1);
    std::string last_observed = "no reply";

    for (size_t attempt = 1; attempt <= max_attempts; ++attempt)
    {
        if (ErrorCode ec = command(); ec)
            return ec;

        if (policy.backoff.count() > 0)
            std::this_thread::sleep_for(policy.backoff);

        auto observed = query();
        if (observed.hasError())
        {
            if (observed.getError() != RcErrc::parse_error)
                return observed.takeError();
            last_observed = "unparsable reply (" + observed.getError().detail() + ")";
        }
        else if (converged(observed.getValue()))
        {
            LOG(DEBUG, log_tag) << what << ": converged after " << attempt << " attempt(s)\n";
            return {};
        }
        else
        {
            last_observed = detail::describe(observed.getValue());
        }
        LOG(DEBUG, log_tag) << what << ": attempt " << attempt << "/" << max_attempts << " observed " << last_observed << "\n";

        if ((policy.deadline.count() > 0) && (std::chrono::steady_clock::now() - start >= policy.deadline))
        {
            LOG(WARNING, log_tag) << what << ": deadline of " << policy.deadline.count() << " ms exceeded after " << attempt << " attempt(s)\n";
            return {RcErrc::not_converged, what + ": observed " + last_observed + " when the deadline expired after " + std::to_string(attempt) + " attempt(s)"};
        }
    }

    LOG(WARNING, log_tag) << what << ": giving up after " << max_attempts << " attempt(s), observed " << last_observed << "\n";
    return {RcErrc::not_converged, what + ": observed " + last_observed + " after " + std::to_string(max_attempts) + " attempt(s)"};
}

} // namespace vlcrc
