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
#ifndef __manager_hpp__
#define __manager_hpp__

#include <deque>
#include <queue>
#include <string>

#include <jinx/async.hpp>
#include <jinx/macros.hpp>
#include <jinx/queue.hpp>

#include "async.hpp"
#include "drv_egis/background.hpp"
#include "drv_egis/calibration.hpp"
#include "drv_egis/profile.hpp"
#include "drv_egis/sequencer.hpp"
#include "drv_egis/transport.hpp"

namespace egispp {

struct ManagerConfig
{
    SequencerConfig _sequencer{};
    CalibrationConfig _calibration{};

    // 0 for unlimited
    size_t _captures{};

    std::string _baseline_path{};
};

struct CaptureEvent
{
    enum {
        StateChanged,
        Capture,
        Dropped,
        Error,
        Finished
    } _type{Finished};

    CalibrationState _from{};
    CalibrationState _to{};

    size_t _index{};
    CaptureResult _result{};
    std::error_code _error{};
};

typedef jinx::Queue<std::queue<CaptureEvent>> EventQueue;

/*
    Owns the baseline and the calibration engine, and runs them as a
    worker task on the loop. The consumer reads CaptureEvents from
    get_events() until Finished; a cancelled worker resets the queue
    instead.
*/
class Manager {
    jinx::Loop& _loop;
    Transport& _transport;
    DeviceProfile _profile;
    ManagerConfig _config;

    BackgroundModel _model;
    CalibrationEngine _engine;

    EventQueue _events{0};
    std::deque<CaptureEvent> _pending{};

    jinx::TaskPtr _task{};
    bool _running{};
    std::error_code _result{};

public:
    Manager(jinx::Loop& loop, Transport& transport, const DeviceProfile& profile, const ManagerConfig& config);

    JINX_NO_COPY_NO_MOVE(Manager);

    jinx::Loop& get_loop() { return _loop; }
    Transport& get_transport() { return _transport; }
    const DeviceProfile& get_profile() const { return _profile; }
    const ManagerConfig& get_config() const { return _config; }
    BackgroundModel& get_model() { return _model; }
    CalibrationEngine& get_engine() { return _engine; }
    EventQueue* get_events() { return &_events; }

    // worker task, for async_cancel()
    jinx::TaskPtr& get_task() { return _task; }

    bool running() const { return _running; }

    // operation_canceled when the worker was cancelled
    const std::error_code& get_result() const { return _result; }

    void start();

    // events wait here until the worker puts them on the queue
    void post(CaptureEvent&& event) { _pending.emplace_back(std::move(event)); }
    bool next_pending(CaptureEvent& event);

    void save_baseline(BaselineSnapshot& saved);

    void finished(const std::error_code& result, bool reset_events);
};

}

#endif
