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
#ifndef __calibration_hpp__
#define __calibration_hpp__

#include <functional>
#include <string>
#include <system_error>
#include <vector>

#include <jinx/async.hpp>
#include <jinx/macros.hpp>

#include "background.hpp"
#include "profile.hpp"
#include "quality.hpp"
#include "sequencer.hpp"
#include "transport.hpp"

namespace egispp {

enum class CalibrationState {
    Idle,
    PreInit,
    PostInit,
    BaselineCapturing,
    BaselineReady,
    Streaming,
    Degraded,
    Failed
};

const char* to_string(CalibrationState state);

struct CalibrationConfig
{
    // background captures before giving up
    size_t _samples{10};

    // accumulated samples required before a clean average may be frozen
    size_t _min_samples{1};

    // consecutive noisy captures before the baseline is considered drifted
    size_t _noisy_limit{5};

    QualityThresholds _thresholds{};
};

struct CalibrationSession
{
    CalibrationState _state{CalibrationState::Idle};

    size_t _pre_init_attempts{};
    size_t _post_init_attempts{};
    size_t _baseline_attempts{};
    size_t _samples{};
    size_t _noisy_streak{};
    size_t _captures{};
    float _ratio{};

    // failing command counted from 1 within the phase, 0 when no command failed
    std::string _failed_phase{};
    size_t _failed_index{};
    std::error_code _error{};
};

struct CaptureResult
{
    PixelBuffer _raw{};
    PixelBuffer _corrected{};
    QualityVerdict _verdict{};
};

typedef std::function<void(CalibrationState from, CalibrationState to)> StateObserver;

/*
    Idle -> PreInit -> PostInit -> BaselineCapturing -> BaselineReady -> Streaming

    Streaming falls to Degraded after _noisy_limit consecutive noisy captures,
    any transport error lands in Failed. Only calibrate() leaves Failed,
    unless a persisted baseline allows warm_start().

    calibrate() and capture() are awaited; the outcome is get_error().
*/
class CalibrationEngine : public jinx::AsyncRoutine {
    BackgroundModel& _model;
    const DeviceProfile& _profile;
    CalibrationConfig _config;
    SequencerConfig _sequencer_config;

    ImageAssembler _assembler;
    CalibrationSession _session{};
    StateObserver _observer{};

    Transport* _transport{};
    CaptureResult* _result{};
    std::error_code _error{};
    bool _capturing{};
    bool _running{};

    CommandList _background{};
    std::vector<Frame> _frames{};
    SequenceReport _report{};
    size_t _attempt{};
    std::error_code _image_error{};

    CommandSequencer _sequencer{};

public:
    CalibrationEngine(
        BackgroundModel& model,
        const DeviceProfile& profile,
        const CalibrationConfig& config,
        const SequencerConfig& sequencer_config)
    : _model(model), _profile(profile), _config(config), _sequencer_config(sequencer_config), _assembler(profile._geometry)
    { }

    JINX_NO_COPY_NO_MOVE(CalibrationEngine);

    const CalibrationSession& session() const { return _session; }
    CalibrationState state() const { return _session._state; }
    const CalibrationConfig& get_config() const { return _config; }
    const SequencerConfig& get_sequencer_config() const { return _sequencer_config; }

    // outcome of the last calibrate() or capture()
    const std::error_code& get_error() const { return _error; }

    void set_observer(StateObserver observer) { _observer = std::move(observer); }

    // valid from any state, discards the current baseline
    CalibrationEngine& calibrate(Transport* transport);

    // in Streaming; a Degraded engine recalibrates first
    CalibrationEngine& capture(Transport* transport, CaptureResult* result);

    // use a baseline restored into the model, skipping the init phases
    std::error_code warm_start();

    std::error_code begin_capture();

    // the awaiting task was cancelled, a calibration in progress ends in Failed
    void abort();

protected:
    void async_finalize() noexcept override;

    void transition(CalibrationState state);
    std::error_code fail(const char* phase, size_t index, const std::error_code& error);

    jinx::Async finish(const std::error_code& error);

    jinx::Async pre_init();
    jinx::Async pre_init_done();
    jinx::Async post_init_done();
    jinx::Async background();
    jinx::Async background_done();
    jinx::Async calibrated();
    jinx::Async repeat();
    jinx::Async repeat_done();
};

}

#endif
