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
#include <signal.h>
#include <syslog.h>
#include <sys/stat.h>
#include <unistd.h>

#include <array>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <jinx/async.hpp>
#include <jinx/libevent.hpp>
#include <jinx/logging.hpp>
#include <jinx/record.hpp>
#include <jinx/argparse.hpp>
#include <jinx/usb/usb.hpp>

#include "async.hpp"
#include "cvext.hpp"
#include "manager.hpp"
#include "drv_egis/eh575.hpp"
#include "drv_egis/usb_transport.hpp"

using namespace jinx;
using namespace jinx::record;
using namespace jinx::argparse;
using namespace egispp;

const std::array<Argument, 18> arguments
{{
    { "vendor", size_t(EH575_VENDOR), size_t(1), size_t(0xFFFF), "usb vendor id" },
    { "product", size_t(EH575_PRODUCT), size_t(1), size_t(0xFFFF), "usb product id" },
    { "profile", "", 0, 4096, "device profile file, built-in eh575 tables when empty" },
    { "dump-profile", "", 0, 4096, "write the active device profile to this file and exit" },
    { "samples", size_t(10), size_t(1), size_t(1000), "background captures before calibration gives up" },
    { "min-samples", size_t(1), size_t(1), size_t(1000), "background captures required before a clean average is frozen" },
    { "noisy-limit", size_t(5), size_t(0), size_t(1000), "consecutive noisy captures before recalibration, 0 never" },
    { "retries", size_t(3), size_t(0), size_t(16), "retries per command" },
    { "backoff-ms", size_t(50), size_t(1), size_t(60000), "first retry backoff" },
    { "command-timeout-ms", size_t(5000), size_t(1), size_t(600000), "response deadline per command" },
    { "chunk-timeout-ms", size_t(2000), size_t(1), size_t(600000), "timeout per response chunk" },
    { "clean-threshold", float(0.03), float(0.0), float(1.0), "non-zero ratio below which an image is clean" },
    { "fingerprint-threshold", float(0.15), float(0.0), float(1.0), "non-zero ratio above which an image is a fingerprint" },
    { "captures", size_t(0), size_t(0), size_t(0xFFFFFFFF), "captures to take, 0 until interrupted" },
    { "baseline-path", "", 0, 4096, "persisted baseline, loaded on start and written after calibration" },
    { "output-path", ".", 1, 4096, "directory for fingerprint captures" },
    { "preview", false, "write a png preview beside each capture" },
    { "debug", false, "debug" }
}};

#define OPT(t, n) config.check<RecordImmediate<t>>(n)->get_value()

static ManagerConfig load_config(RecordCategory& config)
{
    ManagerConfig output{};

    output._sequencer._retries = OPT(size_t, "retries");
    output._sequencer._backoff = std::chrono::milliseconds{OPT(size_t, "backoff-ms")};
    output._sequencer._command_timeout = std::chrono::milliseconds{OPT(size_t, "command-timeout-ms")};
    output._sequencer._chunk_timeout = std::chrono::milliseconds{OPT(size_t, "chunk-timeout-ms")};

    output._calibration._samples = OPT(size_t, "samples");
    output._calibration._min_samples = OPT(size_t, "min-samples");
    output._calibration._noisy_limit = OPT(size_t, "noisy-limit");
    output._calibration._thresholds._clean = OPT(float, "clean-threshold");
    output._calibration._thresholds._fingerprint = OPT(float, "fingerprint-threshold");

    output._captures = OPT(size_t, "captures");
    output._baseline_path = OPT(std::string, "baseline-path");
    return output;
}

static bool write_capture(const std::string& directory, size_t index, const CaptureResult& result, bool preview)
{
    char stamp[16]{};
    std::time_t now = std::time(nullptr);
    std::tm local{};
    ::localtime_r(&now, &local);
    std::strftime(stamp, sizeof(stamp), "%H%M%S", &local);

    std::string base = "fingerprint_" + std::to_string(index) + "_" + stamp;
    auto path = std::filesystem::path{directory} / (base + ".bin");

    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    if (not file) {
        jinx_log_error() << "open " << path << " failed" << std::endl;
        return false;
    }

    auto bytes = result._corrected.bytes();
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (not file) {
        jinx_log_error() << "write " << path << " failed" << std::endl;
        return false;
    }

    if (preview) {
        auto png = std::filesystem::path{directory} / (base + ".png");
        if (not cvext::write_preview(png.string(), result._corrected._pixels)) {
            jinx_log_warning() << "preview " << png << " not written" << std::endl;
        }
    }

    std::cout << "saved " << path.string() << std::endl;
    return true;
}

static volatile std::sig_atomic_t _stop_signal = 0;

static void on_signal(int signo)
{
    _stop_signal = signo;
}

// prints events and writes fingerprint captures
class CaptureWriter : public AsyncRoutine {
    Manager* _manager{};
    std::string _output_path{};
    bool _preview{};
    int* _exit_code{};
    bool* _done{};

    EventQueue::Get _get_event{};

public:
    CaptureWriter& operator ()(Manager* manager, const std::string& output_path, bool preview, int* exit_code, bool* done)
    {
        _manager = manager;
        _output_path = output_path;
        _preview = preview;
        _exit_code = exit_code;
        _done = done;
        *_done = false;
        async_start(&CaptureWriter::get_event);
        return *this;
    }

protected:
    void async_finalize() noexcept override {
        _get_event.reset();
        *_done = true;
        AsyncRoutine::async_finalize();
    }

    Async handle_error(const error::Error& error) override {
        auto state = AsyncRoutine::handle_error(error);
        if (state != ControlState::Raise) {
            return state;
        }

        // the queue is reset when the worker is cancelled
        if (error.category() == category_awaitable()) {
            if (static_cast<ErrorAwaitable>(error.value()) == ErrorAwaitable::Cancelled) {
                return async_return();
            }
        }
        return state;
    }

    Async get_event() {
        return *this / _get_event(_manager->get_events()) / &CaptureWriter::handle_event;
    }

    Async handle_event() {
        auto& event = _get_event.get_result();
        switch (event._type) {
            case CaptureEvent::StateChanged:
                std::cout << "state: " << to_string(event._from) << " -> " << to_string(event._to) << std::endl;
                break;
            case CaptureEvent::Capture:
                std::cout << "capture #" << event._index << ": "
                    << to_string(event._result._verdict._classification)
                    << " (" << event._result._verdict._non_zero_ratio << ")" << std::endl;
                if (event._result._verdict._classification == Classification::Fingerprint) {
                    (void)write_capture(_output_path, event._index, event._result, _preview);
                }
                break;
            case CaptureEvent::Dropped:
                jinx_log_warning() << "capture dropped: " << event._error.message() << std::endl;
                break;
            case CaptureEvent::Error:
                jinx_log_error() << "stopped: " << event._error.message() << std::endl;
                *_exit_code = -1;
                break;
            case CaptureEvent::Finished:
                return async_return();
        }
        return get_event();
    }
};

/*
    Turns SIGINT/SIGTERM into a cancellation of the worker and stops the
    loop once the worker, the event consumer and the USB link are done.
*/
class Supervisor : public AsyncRoutine {
    Loop* _loop{};
    Manager* _manager{};
    bool* _writer_done{};
    bool _cancelled{};

    async::Sleep _sleep{};

public:
    Supervisor& operator ()(Loop* loop, Manager* manager, bool* writer_done)
    {
        _loop = loop;
        _manager = manager;
        _writer_done = writer_done;
        _cancelled = false;
        async_start(&Supervisor::check);
        return *this;
    }

protected:
    Async check() {
        if (_stop_signal != 0 and _manager->running() and not _cancelled) {
            syslog(LOG_INFO, "signal %d, stopping", static_cast<int>(_stop_signal));
            _cancelled = true;
            async_cancel(_manager->get_task()) >> JINX_IGNORE_RESULT;
        }

        if (not _manager->running() and *_writer_done and not _manager->get_transport()._served) {
            _loop->exit();
            return async_return();
        }
        return *this / _sleep(std::chrono::milliseconds(100)) / &Supervisor::check;
    }
};

int main(int argc, const char* argv[])
{
    ::umask(0077);

    RecordCategory config{};
    parse_argv(argc, argv, config, arguments.data(), arguments.size());

    int log_options = LOG_PID | LOG_NDELAY;
    if (OPT(bool, "debug")) {
        log_options |= LOG_PERROR;
    }
    openlog(argv[0], log_options, LOG_USER);
    syslog(LOG_INFO, "egispp starting");

    DeviceProfile profile = DeviceProfile::eh575();

    auto profile_path = OPT(std::string, "profile");
    if (not profile_path.empty()) {
        auto ret = profile.load(profile_path);
        if (ret) {
            jinx_log_error() << "load profile " << profile_path << ": " << ret.message() << std::endl;
            return -1;
        }
    }

    auto dump_path = OPT(std::string, "dump-profile");
    if (not dump_path.empty()) {
        auto ret = profile.save(dump_path);
        if (ret) {
            jinx_log_error() << "save profile " << dump_path << ": " << ret.message() << std::endl;
            return -1;
        }
        return 0;
    }

    profile._vendor = static_cast<uint16_t>(OPT(size_t, "vendor"));
    profile._product = static_cast<uint16_t>(OPT(size_t, "product"));

    libevent::EventEngineLibevent eve(false);
    Loop loop(&eve);

    AsyncUSB usb{eve};

    USBTransport device{};
    auto ret = device.open(usb, profile._vendor, profile._product);
    if (ret) {
        jinx_log_error() << "open device: " << ret.message() << std::endl;
        return -1;
    }

    ::signal(SIGINT, on_signal);
    ::signal(SIGTERM, on_signal);

    Transport transport{};
    Manager manager{loop, transport, profile, load_config(config)};

    int exit_code = 0;
    bool writer_done = false;

    manager.start();
    loop.task_new<USBLink>(&device, &transport);
    loop.task_new<CaptureWriter>(&manager, OPT(std::string, "output-path"), OPT(bool, "preview"), &exit_code, &writer_done);
    loop.task_new<Supervisor>(&loop, &manager, &writer_done);

    loop.run();

    device.close();

    syslog(LOG_INFO, "egispp exit");
    closelog();
    return exit_code;
}
