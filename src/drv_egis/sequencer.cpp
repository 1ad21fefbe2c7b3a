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
#include <algorithm>
#include <iostream>

#include <jinx/logging.hpp>

#include "errors.hpp"
#include "sequencer.hpp"

namespace egispp {
using namespace jinx;
using namespace std::chrono;

CommandSequencer& CommandSequencer::operator ()(
    Transport* transport,
    const SequencerConfig* config,
    const CommandList* commands,
    std::vector<Frame>* frames,
    SequenceReport* report)
{
    _transport = transport;
    _config = config;
    _commands = commands;
    _frames = frames;
    _report = report;

    *_report = SequenceReport{};
    _frames->clear();
    _frames->reserve(_commands->size());

    _index = 0;
    _running = true;
    async_start(&CommandSequencer::next_command);
    return *this;
}

void CommandSequencer::async_finalize() noexcept
{
    abort();
    _put_request.reset();
    _get_reply.reset();
    _chunks.clear();
    AsyncRoutine::async_finalize();
}

void CommandSequencer::abort()
{
    if (not _running) {
        return;
    }
    _running = false;

    if (_index < _commands->size()) {
        _report->_failed_index = _index + 1;
        _report->_failed_label = command()._label;
    }
    _report->_error = std::make_error_code(std::errc::operation_canceled);
}

bool CommandSequencer::is_retryable(const std::error_code& error)
{
    if (error.category() == category_protocol()) {
        return true;
    }
    return error == TransportError::Timeout;
}

milliseconds CommandSequencer::backoff(const SequencerConfig& config, size_t attempt)
{
    auto shift = std::min<size_t>(attempt == 0 ? 0 : attempt - 1, 16);
    return milliseconds{config._backoff.count() * static_cast<milliseconds::rep>(size_t{1} << shift)};
}

Async CommandSequencer::next_command()
{
    if (_index >= _commands->size()) {
        _running = false;
        return async_return();
    }
    _attempt = 1;
    return send();
}

Async CommandSequencer::send()
{
    _report->_attempts += 1;
    _frame = Frame{};
    _chunks.clear();
    _received = 0;
    _deadline = steady_clock::now() + _config->_command_timeout;

    TransportRequest request{};
    request._type = TransportRequest::Send;
    request._data = codec::encode(command());
    request._timeout = _config->_command_timeout;
    return *this
        / _put_request(&_transport->_requests, std::move(request))
        / &CommandSequencer::wait_send;
}

Async CommandSequencer::wait_send()
{
    return *this / _get_reply(&_transport->_replies) / &CommandSequencer::sent;
}

Async CommandSequencer::sent()
{
    auto error = _get_reply.get_result()._error;
    if (error) {
        return failed(error);
    }
    return receive();
}

Async CommandSequencer::receive()
{
    TransportRequest request{};
    request._type = TransportRequest::Receive;

    if (command()._response == ResponseSize::Small) {
        request._max_length = _config->_small_response_max;
        request._timeout = _config->_command_timeout;
    } else {
        // never abandon a frame half way, the device would answer the next command with the rest of it
        const size_t total = codec::MagicSize + command()._response_length;
        auto now = steady_clock::now();
        if (now >= _deadline) {
            jinx_log_warning() << "command " << command()._label << ": " << _received << "/" << total
                << " bytes before deadline" << std::endl;
            return failed(ProtocolError::IncompleteChunk);
        }

        auto timeout = std::min(_config->_chunk_timeout, duration_cast<milliseconds>(_deadline - now));
        if (timeout.count() == 0) {
            timeout = milliseconds{1};
        }
        request._max_length = std::min(total - _received, _config->_chunk_max);
        request._timeout = timeout;
    }

    return *this
        / _put_request(&_transport->_requests, std::move(request))
        / &CommandSequencer::wait_receive;
}

Async CommandSequencer::wait_receive()
{
    return *this / _get_reply(&_transport->_replies) / &CommandSequencer::received;
}

Async CommandSequencer::received()
{
    auto reply = std::move(_get_reply.get_result());

    if (command()._response == ResponseSize::Small) {
        if (reply._error) {
            return failed(reply._error);
        }
        auto ret = codec::decode(reply._data, command()._response_length, _frame);
        if (ret) {
            return failed(ret);
        }
        return complete();
    }

    const size_t total = codec::MagicSize + command()._response_length;

    if (reply._error == TransportError::Timeout) {
        jinx_log_warning() << "command " << command()._label << ": chunk timeout at "
            << _received << "/" << total << " bytes" << std::endl;
        return failed(ProtocolError::IncompleteChunk);
    }
    if (reply._error) {
        return failed(reply._error);
    }

    if (not reply._data.empty()) {
        _received += reply._data.size();
        _chunks.emplace_back(std::move(reply._data));
    }
    if (_received < total) {
        return receive();
    }

    auto ret = codec::decode(std::move(_chunks), command()._response_length, _frame);
    _chunks.clear();
    if (ret) {
        return failed(ret);
    }
    return complete();
}

Async CommandSequencer::complete()
{
    auto delay = command()._delay;
    _frames->emplace_back(std::move(_frame));
    _index += 1;

    if (delay.count() > 0) {
        return *this / _sleep(delay) / &CommandSequencer::next_command;
    }
    return next_command();
}

Async CommandSequencer::failed(const std::error_code& error)
{
    if (not is_retryable(error) or _attempt > _config->_retries) {
        return give_up(error);
    }
    _error = error;
    _drained = 0;
    return drain();
}

Async CommandSequencer::give_up(const std::error_code& error)
{
    _report->_failed_index = _index + 1;
    _report->_failed_label = command()._label;
    _report->_error = error;

    jinx_log_error() << "command #" << _index + 1 << " (" << command()._label << ") failed after "
        << _attempt << " attempt(s): " << error.message() << std::endl;

    _running = false;
    return async_return();
}

Async CommandSequencer::drain()
{
    if (_drained >= _config->_drain_limit) {
        return retry();
    }

    TransportRequest request{};
    request._type = TransportRequest::Receive;
    request._max_length = _config->_chunk_max;
    request._timeout = _config->_drain_timeout;
    return *this
        / _put_request(&_transport->_requests, std::move(request))
        / &CommandSequencer::wait_drain;
}

Async CommandSequencer::wait_drain()
{
    return *this / _get_reply(&_transport->_replies) / &CommandSequencer::drained;
}

Async CommandSequencer::drained()
{
    const auto& reply = _get_reply.get_result();
    if (reply._error == TransportError::Timeout) {
        return retry();
    }
    if (reply._error) {
        return give_up(reply._error);
    }

    _drained += 1;
    jinx_log_warning() << "command " << command()._label << ": discarded " << reply._data.size()
        << " stale bytes" << std::endl;
    return drain();
}

Async CommandSequencer::retry()
{
    auto delay = backoff(*_config, _attempt);
    jinx_log_warning() << "command " << command()._label << ": " << _error.message()
        << ", retry in " << delay.count() << "ms" << std::endl;

    _attempt += 1;
    return *this / _sleep(delay) / &CommandSequencer::send;
}

}
