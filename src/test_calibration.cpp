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
#include <utility>

#include <gtest/gtest.h>

#include "drv_egis/calibration.hpp"
#include "drv_egis/errors.hpp"
#include "test_sensor.hpp"

using namespace egispp;
using namespace jinx;

typedef std::pair<CalibrationState, CalibrationState> Transition;

// what one Drive task does with the engine, and what came of it
struct Script
{
    CalibrationEngine* _engine{};
    Transport* _transport{};

    bool _calibrate{true};
    bool _begin_capture{true};
    size_t _captures{};

    std::error_code _calibrated{};
    std::vector<std::error_code> _capture_errors{};
    std::vector<CaptureResult> _results{};
    bool _done{};
};

class Drive : public AsyncRoutine {
    Script* _script{};
    CaptureResult _result{};

public:
    Drive& operator ()(Script* script)
    {
        _script = script;
        async_start(&Drive::calibrate);
        return *this;
    }

protected:
    void async_finalize() noexcept override {
        _script->_engine->abort();
        _script->_transport->close();
        AsyncRoutine::async_finalize();
    }

    CalibrationEngine& engine() { return *_script->_engine; }

    Async calibrate() {
        if (not _script->_calibrate) {
            return begin_capture();
        }
        return *this / engine().calibrate(_script->_transport) / &Drive::calibrated;
    }

    Async calibrated() {
        _script->_calibrated = engine().get_error();
        if (_script->_calibrated) {
            return done();
        }
        return begin_capture();
    }

    Async begin_capture() {
        if (_script->_begin_capture and _script->_captures != 0) {
            auto ret = engine().begin_capture();
            if (ret) {
                _script->_capture_errors.push_back(ret);
                return done();
            }
        }
        return next_capture();
    }

    Async next_capture() {
        if (_script->_results.size() >= _script->_captures) {
            return done();
        }
        return *this / engine().capture(_script->_transport, &_result) / &Drive::captured;
    }

    Async captured() {
        auto ret = engine().get_error();
        _script->_capture_errors.push_back(ret);
        _script->_results.emplace_back(std::move(_result));
        if (engine().state() == CalibrationState::Failed or ret == CalibrationError::InvalidState) {
            return done();
        }
        return next_capture();
    }

    Async done() {
        _script->_done = true;
        return async_return();
    }
};

struct CalibrationRig : test::Rig
{
    DeviceProfile _profile{test::small_profile()};
    BackgroundModel _model{_profile._geometry};
    CalibrationEngine _engine;
    std::vector<Transition> _transitions{};
    Script _script{};

    explicit CalibrationRig(const CalibrationConfig& config = CalibrationConfig{})
    : _engine(_model, _profile, config, test::fast_sequencer())
    {
        _stub._background = []() { return test::image(0); };
        _stub._capture = []() { return test::image(0); };
        _engine.set_observer([this](CalibrationState from, CalibrationState to) {
            _transitions.emplace_back(from, to);
        });
        _script._engine = &_engine;
        _script._transport = &_transport;
    }

    const Script& execute() {
        _stub._cancel_task = _loop.task_new<Drive>(&_script);
        run();
        return _script;
    }

    const Script& calibrate() {
        _script._calibrate = true;
        _script._captures = 0;
        return execute();
    }

    const Script& stream(size_t captures) {
        _script._calibrate = true;
        _script._captures = captures;
        return execute();
    }

    bool saw(CalibrationState from, CalibrationState to) const {
        return std::find(_transitions.begin(), _transitions.end(), Transition{from, to}) != _transitions.end();
    }
};

static bool bad_magic_for(unsigned char opcode, const Bytes& request, test::SensorStub& stub)
{
    if (request.at(codec::MagicSize) != opcode) {
        return false;
    }
    stub.push_raw(Bytes{0x00, 0x00, 0x00, 0x00});
    return true;
}

TEST(CalibrationEngine, CalibratesAndStreams)
{
    CalibrationRig rig{};
    rig._stub._capture = []() { return test::image(20); };

    const auto& script = rig.stream(1);
    ASSERT_FALSE(script._calibrated);
    ASSERT_TRUE(script._done);

    std::vector<Transition> expected{
        {CalibrationState::Idle, CalibrationState::PreInit},
        {CalibrationState::PreInit, CalibrationState::PostInit},
        {CalibrationState::PostInit, CalibrationState::BaselineCapturing},
        {CalibrationState::BaselineCapturing, CalibrationState::BaselineReady},
        {CalibrationState::BaselineReady, CalibrationState::Streaming},
    };
    EXPECT_EQ(rig._transitions, expected);

    const auto& session = rig._engine.session();
    EXPECT_EQ(session._pre_init_attempts, 3);
    EXPECT_EQ(session._post_init_attempts, 2);
    EXPECT_EQ(session._baseline_attempts, 1);
    EXPECT_EQ(session._samples, 1);
    EXPECT_TRUE(rig._model.frozen());

    EXPECT_EQ(rig._stub.opcodes(), (std::vector<unsigned char>{0x60, 0x61, 0x63, 0x62, 0x62, 0x73, 0x61, 0x64}));

    ASSERT_EQ(script._results.size(), 1);
    EXPECT_FALSE(script._capture_errors.front());

    const auto& result = script._results.front();
    EXPECT_EQ(result._verdict._classification, Classification::Fingerprint);
    EXPECT_NEAR(result._verdict._non_zero_ratio, 0.20F, 1e-6);
    EXPECT_EQ(cv::countNonZero(result._raw._pixels), 20);
    EXPECT_EQ(cv::countNonZero(result._corrected._pixels), 20);
    EXPECT_EQ(session._captures, 1);
    EXPECT_EQ(rig._engine.state(), CalibrationState::Streaming);
}

TEST(CalibrationEngine, FirstCleanSampleFreezes)
{
    CalibrationRig rig{};

    size_t count = 0;
    rig._stub._background = [&]() { return test::image(count++ == 0 ? 0 : 10); };

    ASSERT_FALSE(rig.calibrate()._calibrated);
    EXPECT_EQ(rig._engine.state(), CalibrationState::BaselineReady);
    EXPECT_EQ(rig._engine.session()._samples, 1);
    EXPECT_EQ(rig._engine.session()._baseline_attempts, 1);
    EXPECT_EQ(count, 1);
    EXPECT_TRUE(rig._model.frozen());
    EXPECT_EQ(cv::countNonZero(rig._model.average()._pixels), 0);
}

TEST(CalibrationEngine, NoisyBaselineFails)
{
    CalibrationConfig config{};
    config._samples = 10;

    CalibrationRig rig{config};
    rig._stub._background = []() { return test::image(10); };

    auto ret = rig.calibrate()._calibrated;
    EXPECT_EQ(ret, make_error_code(CalibrationError::NoisyBaseline));
    EXPECT_EQ(rig._engine.state(), CalibrationState::Failed);

    const auto& session = rig._engine.session();
    EXPECT_EQ(session._error, ret);
    EXPECT_EQ(session._failed_phase, "baseline");
    EXPECT_EQ(session._failed_index, 0);
    EXPECT_EQ(session._baseline_attempts, 10);
    EXPECT_EQ(session._samples, 10);
    EXPECT_NEAR(session._ratio, 0.10F, 1e-6);
    EXPECT_FALSE(rig._model.frozen());
    EXPECT_TRUE(rig.saw(CalibrationState::BaselineCapturing, CalibrationState::Failed));
}

TEST(CalibrationEngine, CleanBaselineMayHaveResidue)
{
    CalibrationRig rig{};
    rig._stub._background = []() { return test::image(2); };

    ASSERT_FALSE(rig.calibrate()._calibrated);
    EXPECT_EQ(rig._engine.session()._samples, 1);
    EXPECT_NEAR(rig._engine.session()._ratio, 0.02F, 1e-6);
}

TEST(CalibrationEngine, MinimumSamples)
{
    CalibrationConfig config{};
    config._min_samples = 3;

    CalibrationRig rig{config};
    ASSERT_FALSE(rig.calibrate()._calibrated);
    EXPECT_EQ(rig._engine.session()._samples, 3);
    EXPECT_EQ(rig._engine.session()._baseline_attempts, 3);
}

TEST(CalibrationEngine, FewerSamplesThanMinimum)
{
    CalibrationConfig config{};
    config._samples = 2;
    config._min_samples = 3;

    CalibrationRig rig{config};
    ASSERT_FALSE(rig.calibrate()._calibrated);
    EXPECT_EQ(rig._engine.session()._samples, 2);
    EXPECT_EQ(rig._engine.state(), CalibrationState::BaselineReady);
}

TEST(CalibrationEngine, PreInitFailureIndex)
{
    CalibrationRig rig{};
    rig._stub._hook = [](size_t index, const Bytes& request, test::SensorStub& stub) {
        return bad_magic_for(0x61, request, stub);
    };

    EXPECT_EQ(rig.calibrate()._calibrated, make_error_code(ProtocolError::BadMagic));
    EXPECT_EQ(rig._engine.state(), CalibrationState::Failed);

    const auto& session = rig._engine.session();
    EXPECT_EQ(session._failed_phase, "pre-init");
    EXPECT_EQ(session._failed_index, 2);

    // nothing after the failing command
    EXPECT_EQ(rig._stub._sent.size(), 2);
    EXPECT_FALSE(rig.saw(CalibrationState::PreInit, CalibrationState::PostInit));
}

TEST(CalibrationEngine, TransportErrorFails)
{
    CalibrationRig rig{};
    rig._stub._fail_send_at = 4;

    EXPECT_EQ(rig.calibrate()._calibrated, make_error_code(TransportError::Disconnected));
    EXPECT_EQ(rig._engine.state(), CalibrationState::Failed);
    EXPECT_EQ(rig._engine.session()._failed_phase, "post-init");
    EXPECT_EQ(rig._engine.session()._failed_index, 2);
}

TEST(CalibrationEngine, BaselineTransportErrorIndex)
{
    CalibrationRig rig{};

    // the background command is the sixth send
    rig._stub._fail_send_at = 5;

    EXPECT_EQ(rig.calibrate()._calibrated, make_error_code(TransportError::Disconnected));
    EXPECT_EQ(rig._engine.state(), CalibrationState::Failed);
    EXPECT_EQ(rig._engine.session()._failed_phase, "baseline");
    EXPECT_EQ(rig._engine.session()._failed_index, 1);
    EXPECT_EQ(rig._engine.session()._baseline_attempts, 1);
}

TEST(CalibrationEngine, RecoversFromFailed)
{
    CalibrationRig rig{};
    rig._stub._fail_send_at = 0;
    ASSERT_TRUE(rig.calibrate()._calibrated);
    ASSERT_EQ(rig._engine.state(), CalibrationState::Failed);

    test::Rig second{};
    second._stub._background = []() { return test::image(0); };

    Script script{};
    script._engine = &rig._engine;
    script._transport = &second._transport;
    second._loop.task_new<Drive>(&script);
    second.run();

    ASSERT_FALSE(script._calibrated);
    EXPECT_EQ(rig._engine.state(), CalibrationState::BaselineReady);
    EXPECT_FALSE(rig._engine.session()._error);
    EXPECT_TRUE(rig.saw(CalibrationState::Failed, CalibrationState::PreInit));
}

TEST(CalibrationEngine, CancelledCalibrationFails)
{
    CalibrationRig rig{};
    rig._stub._cancel_at = 2;

    const auto& script = rig.calibrate();
    EXPECT_FALSE(script._done);
    EXPECT_TRUE(rig._engine.get_error() == std::errc::operation_canceled);
    EXPECT_EQ(rig._engine.state(), CalibrationState::Failed);
    EXPECT_EQ(rig._engine.session()._failed_phase, "pre-init");
    EXPECT_EQ(rig._engine.session()._failed_index, 2);
    EXPECT_EQ(rig._stub._sent.size(), 2);
}

TEST(CalibrationEngine, BackgroundImageErrors)
{
    CalibrationRig rig{};
    rig._profile._background._response_length = 90;
    rig._stub._background = []() { return test::image(0, 0, 90); };

    EXPECT_EQ(rig.calibrate()._calibrated, make_error_code(ImageError::SizeMismatch));
    EXPECT_EQ(rig._engine.state(), CalibrationState::Failed);
    EXPECT_EQ(rig._engine.session()._failed_index, 0);
    EXPECT_EQ(rig._engine.session()._baseline_attempts, 10);
    EXPECT_EQ(rig._engine.session()._samples, 0);
}

TEST(CalibrationEngine, DegradesAndRecalibrates)
{
    CalibrationConfig config{};
    config._noisy_limit = 3;

    CalibrationRig rig{config};

    size_t count = 0;
    rig._stub._capture = [&]() { return test::image(count++ < 3 ? 10 : 0); };

    const auto& script = rig.stream(4);
    ASSERT_EQ(script._results.size(), 4);
    for (size_t idx = 0; idx < 3; ++idx) {
        EXPECT_FALSE(script._capture_errors[idx]);
        EXPECT_EQ(script._results[idx]._verdict._classification, Classification::Noisy);
    }
    EXPECT_TRUE(rig.saw(CalibrationState::Streaming, CalibrationState::Degraded));
    EXPECT_TRUE(rig.saw(CalibrationState::Degraded, CalibrationState::PreInit));

    EXPECT_FALSE(script._capture_errors[3]);
    EXPECT_EQ(script._results[3]._verdict._classification, Classification::Clean);
    EXPECT_EQ(rig._engine.state(), CalibrationState::Streaming);

    // the drifted baseline was discarded and rebuilt before the fourth capture
    std::vector<unsigned char> expected{
        0x60, 0x61, 0x63, 0x62, 0x62, 0x73,
        0x61, 0x64, 0x61, 0x64, 0x61, 0x64,
        0x60, 0x61, 0x63, 0x62, 0x62, 0x73,
        0x61, 0x64,
    };
    EXPECT_EQ(rig._stub.opcodes(), expected);
    EXPECT_EQ(rig._model.count(), 1);
    EXPECT_EQ(rig._engine.session()._captures, 1);
    EXPECT_EQ(rig._engine.session()._noisy_streak, 0);
}

TEST(CalibrationEngine, NoisyStreakResets)
{
    CalibrationConfig config{};
    config._noisy_limit = 3;

    CalibrationRig rig{config};

    size_t count = 0;
    rig._stub._capture = [&]() { return test::image(count++ == 2 ? 0 : 10); };

    const auto& script = rig.stream(5);
    EXPECT_EQ(script._results.size(), 5);
    EXPECT_EQ(rig._engine.state(), CalibrationState::Streaming);
    EXPECT_EQ(rig._engine.session()._noisy_streak, 2);
}

TEST(CalibrationEngine, WarmStart)
{
    CalibrationRig rig{};
    ASSERT_FALSE(rig._model.restore(Baseline{PixelBuffer::zeros(ImageGeometry{10, 10}), 5}));

    ASSERT_FALSE(rig._engine.warm_start());
    EXPECT_EQ(rig._engine.state(), CalibrationState::BaselineReady);
    EXPECT_EQ(rig._engine.session()._samples, 5);

    rig._stub._capture = []() { return test::image(20); };
    rig._script._calibrate = false;
    rig._script._captures = 1;

    const auto& script = rig.execute();
    ASSERT_EQ(script._results.size(), 1);
    EXPECT_FALSE(script._capture_errors.front());
    EXPECT_EQ(script._results.front()._verdict._classification, Classification::Fingerprint);
    EXPECT_EQ(rig._stub.opcodes(), (std::vector<unsigned char>{0x61, 0x64}));
}

TEST(CalibrationEngine, WarmStartNeedsBaseline)
{
    CalibrationRig rig{};
    EXPECT_EQ(rig._engine.warm_start(), make_error_code(CalibrationError::InvalidState));
    EXPECT_EQ(rig._engine.state(), CalibrationState::Idle);

    ASSERT_FALSE(rig.calibrate()._calibrated);
    ASSERT_FALSE(rig._engine.begin_capture());
    EXPECT_EQ(rig._engine.warm_start(), make_error_code(CalibrationError::InvalidState));
    EXPECT_EQ(rig._engine.state(), CalibrationState::Streaming);
}

TEST(CalibrationEngine, CaptureRequiresStreaming)
{
    CalibrationRig rig{};
    EXPECT_EQ(rig._engine.begin_capture(), make_error_code(CalibrationError::InvalidState));

    rig._script._calibrate = false;
    rig._script._begin_capture = false;
    rig._script._captures = 1;

    const auto& script = rig.execute();
    ASSERT_EQ(script._capture_errors.size(), 1);
    EXPECT_EQ(script._capture_errors.front(), make_error_code(CalibrationError::InvalidState));
    EXPECT_EQ(rig._engine.state(), CalibrationState::Idle);
    EXPECT_TRUE(rig._stub._sent.empty());
}

TEST(CalibrationEngine, CaptureProtocolErrorFails)
{
    CalibrationRig rig{};
    rig._stub._hook = [](size_t index, const Bytes& request, test::SensorStub& stub) {
        return bad_magic_for(0x64, request, stub);
    };

    const auto& script = rig.stream(1);
    ASSERT_EQ(script._capture_errors.size(), 1);
    EXPECT_EQ(script._capture_errors.front(), make_error_code(ProtocolError::BadMagic));
    EXPECT_EQ(rig._engine.state(), CalibrationState::Failed);
    EXPECT_EQ(rig._engine.session()._failed_phase, "repeat");
    EXPECT_EQ(rig._engine.session()._failed_index, 2);
}

TEST(CalibrationEngine, CancelledCaptureKeepsStreaming)
{
    CalibrationRig rig{};

    // six sends calibrate, the seventh starts the capture
    rig._stub._cancel_at = 7;

    const auto& script = rig.stream(1);
    EXPECT_FALSE(script._done);
    EXPECT_TRUE(script._results.empty());
    EXPECT_TRUE(rig._engine.get_error() == std::errc::operation_canceled);
    EXPECT_EQ(rig._engine.state(), CalibrationState::Streaming);
}
