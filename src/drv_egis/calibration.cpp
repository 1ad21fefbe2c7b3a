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
#include <syslog.h>

#include <algorithm>
#include <iostream>

#include <jinx/logging.hpp>

#include "calibration.hpp"
#include "errors.hpp"

namespace egispp {
using namespace jinx;

const char* to_string(CalibrationState state)
{
    switch (state) {
        case CalibrationState::Idle:
            return "idle";
        case CalibrationState::PreInit:
            return "pre-init";
        case CalibrationState::PostInit:
            return "post-init";
        case CalibrationState::BaselineCapturing:
            return "baseline-capturing";
        case CalibrationState::BaselineReady:
            return "baseline-ready";
        case CalibrationState::Streaming:
            return "streaming";
        case CalibrationState::Degraded:
            return "degraded";
        case CalibrationState::Failed:
            return "failed";
    }
    return "unknown";
}

void CalibrationEngine::transition(CalibrationState state)
{
    auto from = _session._state;
    if (from == state) {
        return;
    }
    _session._state = state;
    syslog(LOG_INFO, "calibration: %s -> %s", to_string(from), to_string(state));
    if (_observer) {
        _observer(from, state);
    }
}

std::error_code CalibrationEngine::fail(const char* phase, size_t index, const std::error_code& error)
{
    _session._failed_phase = phase;
    _session._failed_index = index;
    _session._error = error;

    jinx_log_error() << "calibration failed in " << phase << " at #" << index
        << " (ratio " << _session._ratio << "): " << error.message() << std::endl;

    transition(CalibrationState::Failed);
    return error;
}

CalibrationEngine& CalibrationEngine::calibrate(Transport* transport)
{
    _transport = transport;
    _result = nullptr;
    _capturing = false;
    _running = true;
    _error.clear();
    async_start(&CalibrationEngine::pre_init);
    return *this;
}

CalibrationEngine& CalibrationEngine::capture(Transport* transport, CaptureResult* result)
{
    _transport = transport;
    _result = result;
    _capturing = true;
    _running = true;
    _error.clear();
    async_start(&CalibrationEngine::repeat);
    return *this;
}

void CalibrationEngine::async_finalize() noexcept
{
    abort();
    AsyncRoutine::async_finalize();
}

void CalibrationEngine::abort()
{
    _sequencer.abort();

    if (not _running) {
        return;
    }
    _running = false;
    _error = std::make_error_code(std::errc::operation_canceled);

    switch (_session._state) {
        case CalibrationState::PreInit:
            fail("pre-init", _report._failed_index, _error);
            break;
        case CalibrationState::PostInit:
            fail("post-init", _report._failed_index, _error);
            break;
        case CalibrationState::BaselineCapturing:
            fail("baseline", _report._failed_index, _error);
            break;
        default:
            // a capture in flight leaves the state alone
            break;
    }
}

Async CalibrationEngine::finish(const std::error_code& error)
{
    _error = error;
    _running = false;
    return async_return();
}

Async CalibrationEngine::pre_init()
{
    _model.reset();

    auto state = _session._state;
    _session = CalibrationSession{};
    _session._state = state;

    transition(CalibrationState::PreInit);
    return *this
        / _sequencer(_transport, &_sequencer_config, &_profile._pre_init, &_frames, &_report)
        / &CalibrationEngine::pre_init_done;
}

Async CalibrationEngine::pre_init_done()
{
    _session._pre_init_attempts += _report._attempts;
    if (_report._error) {
        return finish(fail("pre-init", _report._failed_index, _report._error));
    }

    transition(CalibrationState::PostInit);
    return *this
        / _sequencer(_transport, &_sequencer_config, &_profile._post_init, &_frames, &_report)
        / &CalibrationEngine::post_init_done;
}

Async CalibrationEngine::post_init_done()
{
    _session._post_init_attempts += _report._attempts;
    if (_report._error) {
        return finish(fail("post-init", _report._failed_index, _report._error));
    }

    transition(CalibrationState::BaselineCapturing);
    if (_config._samples == 0) {
        return finish(fail("baseline", 0, CalibrationError::InvalidState));
    }

    _background = CommandList{_profile._background};
    _attempt = 0;
    _image_error.clear();
    return background();
}

Async CalibrationEngine::background()
{
    if (_attempt >= _config._samples) {
        if (_model.count() == 0 and _image_error) {
            return finish(fail("baseline", 0, _image_error));
        }
        return finish(fail("baseline", 0, CalibrationError::NoisyBaseline));
    }

    _session._baseline_attempts += 1;
    return *this
        / _sequencer(_transport, &_sequencer_config, &_background, &_frames, &_report)
        / &CalibrationEngine::background_done;
}

Async CalibrationEngine::background_done()
{
    if (_report._error) {
        return finish(fail("baseline", _report._failed_index, _report._error));
    }

    PixelBuffer sample{};
    auto ret = _assembler.assemble(_frames.back(), sample);
    if (not ret) {
        ret = _model.accumulate(sample);
    }
    if (ret) {
        jinx_log_warning() << "background sample #" << _attempt + 1 << " skipped: " << ret.message() << std::endl;
        _image_error = ret;
        _attempt += 1;
        return background();
    }

    _session._samples = _model.count();

    auto verdict = quality::classify(_model.average(), _config._thresholds);
    _session._ratio = verdict._non_zero_ratio;

    // checked after every accumulation, the first clean average is frozen
    const size_t required = std::max<size_t>(1, std::min(_config._min_samples, _config._samples));
    if (_session._samples >= required and verdict._classification == Classification::Clean) {
        ret = _model.freeze();
        if (ret) {
            return finish(fail("baseline", 0, ret));
        }
        transition(CalibrationState::BaselineReady);
        return calibrated();
    }

    _attempt += 1;
    return background();
}

Async CalibrationEngine::calibrated()
{
    if (not _capturing) {
        return finish({});
    }

    auto ret = begin_capture();
    if (ret) {
        return finish(ret);
    }
    return repeat();
}

std::error_code CalibrationEngine::warm_start()
{
    if (_session._state != CalibrationState::Idle and _session._state != CalibrationState::Failed) {
        return CalibrationError::InvalidState;
    }

    if (not _model.frozen()) {
        return CalibrationError::InvalidState;
    }

    auto state = _session._state;
    _session = CalibrationSession{};
    _session._state = state;
    _session._samples = _model.count();

    transition(CalibrationState::BaselineReady);
    return {};
}

std::error_code CalibrationEngine::begin_capture()
{
    if (_session._state == CalibrationState::Streaming) {
        return {};
    }
    if (_session._state != CalibrationState::BaselineReady) {
        return CalibrationError::InvalidState;
    }
    _session._noisy_streak = 0;
    transition(CalibrationState::Streaming);
    return {};
}

Async CalibrationEngine::repeat()
{
    if (_session._state == CalibrationState::Degraded) {
        jinx_log_warning() << "baseline drifted after " << _session._noisy_streak
            << " noisy captures, recalibrating" << std::endl;
        return pre_init();
    }

    if (_session._state != CalibrationState::Streaming) {
        return finish(CalibrationError::InvalidState);
    }

    size_t index = 0;
    if (not _profile.find_capture(index)) {
        return finish(fail("repeat", 0, CalibrationError::InvalidState));
    }

    return *this
        / _sequencer(_transport, &_sequencer_config, &_profile._repeat, &_frames, &_report)
        / &CalibrationEngine::repeat_done;
}

Async CalibrationEngine::repeat_done()
{
    if (_report._error) {
        return finish(fail("repeat", _report._failed_index, _report._error));
    }

    size_t index = 0;
    (void)_profile.find_capture(index);

    *_result = CaptureResult{};
    auto ret = _assembler.assemble(_frames.at(index), _result->_raw);
    if (ret) {
        jinx_log_warning() << "capture dropped: " << ret.message() << std::endl;
        return finish(ret);
    }

    ret = _model.subtract(_result->_raw, _result->_corrected);
    if (ret) {
        return finish(ret);
    }

    _result->_verdict = quality::classify(_result->_corrected, _config._thresholds);
    _session._captures += 1;
    _session._ratio = _result->_verdict._non_zero_ratio;

    if (_result->_verdict._classification == Classification::Noisy) {
        _session._noisy_streak += 1;
        if (_config._noisy_limit != 0 and _session._noisy_streak >= _config._noisy_limit) {
            transition(CalibrationState::Degraded);
        }
    } else {
        _session._noisy_streak = 0;
    }
    return finish({});
}

}
