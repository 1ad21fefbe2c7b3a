/*
Copyright (C) 2026  The egispp Authors

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU Affero General Public License as published
by the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU Affero General Public License for more details.

You should have received a copy of the GNU Affero General Public License
along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/
#ifndef __sequencer_hpp__
#define __sequencer_hpp__

#include <chrono>
#include <string>
#include <system_error>
#include <vector>

#include <jinx/async.hpp>
#include <jinx/macros.hpp>

#include "async.hpp"
#include "frame.hpp"
#include "transport.hpp"

namespace egispp {

struct SequencerConfig
{
    size_t _retries{3};
    std::chrono::milliseconds _backoff{50};
    std::chrono::milliseconds _command_timeout{5000};
    std::chrono::milliseconds _chunk_timeout{2000};
    size_t _small_response_max{64};
    size_t _chunk_max{16384};

    // stale bytes are read off the pipe before a retry until this timeout hits
    std::chrono::milliseconds _drain_timeout{20};
    size_t _drain_limit{64};
};

struct SequenceReport
{
    // sends including retries
    size_t _attempts{};

    // position of the failing command counted from 1, 0 when nothing failed
    size_t _failed_index{};
    std::string _failed_label{};
    std::error_code _error{};
};

/*
    Strict request/response runner: a command is sent only after the
    response to the previous one has been received and validated.
    The outcome is left in the report, only cancellation ends the
    routine without one.
*/
class CommandSequencer : public jinx::AsyncRoutine {
    Transport* _transport{};
    const SequencerConfig* _config{};
    const CommandList* _commands{};
    std::vector<Frame>* _frames{};
    SequenceReport* _report{};

    size_t _index{};
    size_t _attempt{};
    Frame _frame{};
    std::vector<Bytes> _chunks{};
    size_t _received{};
    std::chrono::steady_clock::time_point _deadline{};

    std::error_code _error{};
    size_t _drained{};
    bool _running{};

    RequestQueue::Put _put_request{};
    ReplyQueue::Get _get_reply{};
    async::Sleep _sleep{};

public:
    CommandSequencer() = default;

    JINX_NO_COPY_NO_MOVE(CommandSequencer);

    CommandSequencer& operator ()(
        Transport* transport,
        const SequencerConfig* config,
        const CommandList* commands,
        std::vector<Frame>* frames,
        SequenceReport* report);

    bool running() const { return _running; }

    // report the command in flight as cancelled
    void abort();

    static bool is_retryable(const std::error_code& error);

    // backoff * 2^(attempt-1), the exponent stops growing at 16
    static std::chrono::milliseconds backoff(const SequencerConfig& config, size_t attempt);

protected:
    void async_finalize() noexcept override;

    const CommandSpec& command() const { return _commands->at(_index); }

    jinx::Async next_command();
    jinx::Async send();
    jinx::Async wait_send();
    jinx::Async sent();
    jinx::Async receive();
    jinx::Async wait_receive();
    jinx::Async received();
    jinx::Async complete();

    jinx::Async failed(const std::error_code& error);
    jinx::Async give_up(const std::error_code& error);
    jinx::Async drain();
    jinx::Async wait_drain();
    jinx::Async drained();
    jinx::Async retry();
};

}

#endif
