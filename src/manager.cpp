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

#include <iostream>

#include <jinx/logging.hpp>

#include "drv_egis/errors.hpp"
#include "manager.hpp"

namespace egispp {
using namespace jinx;

class CaptureWorker : public AsyncRoutine {
    typedef Async (CaptureWorker::*Step)();

    Manager* _manager{};

    EventQueue::Put _put_event{};
    Step _after_flush{};

    BaselineSnapshot _saved{};
    CaptureResult _result{};
    size_t _index{};
    std::error_code _error{};
    bool _completed{};

public:
    CaptureWorker& operator ()(Manager* manager)
    {
        _manager = manager;
        _saved.reset();
        _index = 0;
        _error.clear();
        _completed = false;
        async_start(&CaptureWorker::load_baseline);
        return *this;
    }

protected:
    void async_finalize() noexcept override {
        if (not _completed) {
            _manager->get_engine().abort();
            _manager->finished(std::make_error_code(std::errc::operation_canceled), true);
            syslog(LOG_INFO, "worker cancelled");
        }
        _put_event.reset();
        AsyncRoutine::async_finalize();
    }

    CalibrationEngine& engine() { return _manager->get_engine(); }

    Async flush() {
        CaptureEvent event{};
        if (not _manager->next_pending(event)) {
            return (this->*_after_flush)();
        }
        return *this / _put_event(_manager->get_events(), std::move(event)) / &CaptureWorker::flush;
    }

    Async flush_then(Step next) {
        _after_flush = next;
        return flush();
    }

    Async load_baseline() {
        syslog(LOG_INFO, "worker starting: %s", _manager->get_profile()._name.c_str());

        const auto& path = _manager->get_config()._baseline_path;
        if (not path.empty()) {
            auto ret = _manager->get_model().load(path);
            if (not ret) {
                ret = engine().warm_start();
                if (not ret) {
                    _saved = _manager->get_model().snapshot();
                    return flush_then(&CaptureWorker::begin_capture);
                }
                jinx_log_warning() << "warm start from " << path << ": " << ret.message() << std::endl;
            } else if (ret != std::errc::no_such_file_or_directory) {
                jinx_log_warning() << "baseline " << path << " ignored: " << ret.message() << std::endl;
            }
        }

        return *this
            / engine().calibrate(&_manager->get_transport())
            / &CaptureWorker::calibrated;
    }

    Async calibrated() {
        auto ret = engine().get_error();
        if (ret) {
            return finish(ret);
        }
        _manager->save_baseline(_saved);
        return flush_then(&CaptureWorker::begin_capture);
    }

    Async begin_capture() {
        auto ret = engine().begin_capture();
        if (ret) {
            return finish(ret);
        }
        return next_capture();
    }

    Async next_capture() {
        auto limit = _manager->get_config()._captures;
        if (limit != 0 and _index >= limit) {
            return finish({});
        }
        return *this
            / engine().capture(&_manager->get_transport(), &_result)
            / &CaptureWorker::captured;
    }

    Async captured() {
        auto ret = engine().get_error();

        CaptureEvent event{};
        if (ret.category() == category_image()) {
            event._type = CaptureEvent::Dropped;
            event._error = ret;
            _manager->post(std::move(event));
            return flush_then(&CaptureWorker::next_capture);
        }
        if (ret) {
            return finish(ret);
        }

        // a degraded baseline may have been rebuilt by this capture
        _manager->save_baseline(_saved);

        event._type = CaptureEvent::Capture;
        event._index = _index;
        event._result = std::move(_result);
        _manager->post(std::move(event));
        _index += 1;
        return flush_then(&CaptureWorker::next_capture);
    }

    Async finish(const std::error_code& error) {
        _error = error;

        if (error) {
            CaptureEvent failed{};
            failed._type = CaptureEvent::Error;
            failed._error = error;
            _manager->post(std::move(failed));
        }

        CaptureEvent finished{};
        finished._type = CaptureEvent::Finished;
        finished._error = error;
        _manager->post(std::move(finished));
        return flush_then(&CaptureWorker::complete);
    }

    Async complete() {
        _completed = true;
        _manager->finished(_error, false);
        syslog(LOG_INFO, "worker finished");
        return async_return();
    }
};

Manager::Manager(jinx::Loop& loop, Transport& transport, const DeviceProfile& profile, const ManagerConfig& config)
: _loop(loop),
  _transport(transport),
  _profile(profile),
  _config(config),
  _model(_profile._geometry),
  _engine(_model, _profile, _config._calibration, _config._sequencer)
{
    _engine.set_observer([this](CalibrationState from, CalibrationState to) {
        CaptureEvent event{};
        event._type = CaptureEvent::StateChanged;
        event._from = from;
        event._to = to;
        post(std::move(event));
    });
}

void Manager::start()
{
    if (_running) {
        return;
    }
    _running = true;
    _result.clear();
    _pending.clear();
    _task = _loop.task_new<CaptureWorker>(this);
}

bool Manager::next_pending(CaptureEvent& event)
{
    if (_pending.empty()) {
        return false;
    }
    event = std::move(_pending.front());
    _pending.pop_front();
    return true;
}

void Manager::save_baseline(BaselineSnapshot& saved)
{
    if (_config._baseline_path.empty()) {
        return;
    }

    auto snapshot = _model.snapshot();
    if (snapshot == nullptr or snapshot == saved) {
        return;
    }

    auto ret = write_baseline(*snapshot, _config._baseline_path);
    if (ret) {
        jinx_log_warning() << "save baseline " << _config._baseline_path << ": " << ret.message() << std::endl;
        return;
    }
    saved = snapshot;
    syslog(LOG_INFO, "baseline saved: %s", _config._baseline_path.c_str());
}

void Manager::finished(const std::error_code& result, bool reset_events)
{
    _result = result;
    _running = false;
    _pending.clear();
    if (reset_events) {
        _events.reset();
    }
    _transport.close();
}

}
