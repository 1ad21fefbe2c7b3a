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
#ifndef __usb_transport_hpp__
#define __usb_transport_hpp__

#include <cstdint>

#include <libusb-1.0/libusb.h>

#include <jinx/async.hpp>
#include <jinx/buffer.hpp>
#include <jinx/macros.hpp>
#include <jinx/posix.hpp>
#include <jinx/usb/usb.hpp>

#include "eh575.hpp"
#include "transport.hpp"

namespace egispp {

struct USBBufferConfig
{
    constexpr static char const* Name = "USBBufferConfig";
    static constexpr const size_t Size = 16384;
    static constexpr const size_t Reserve = 4;
    static constexpr const long Limit = -1;

    struct Information { };
};

typedef jinx::buffer::BufferAllocator<jinx::posix::MemoryProvider, USBBufferConfig> USBAllocator;
typedef typename USBAllocator::BufferType USBBuffer;

/*
    The claimed sensor. One interface is held for the lifetime of the
    object, the kernel driver is detached while it is held.
*/
class USBTransport {
    jinx::usb::USBDeviceHandle _handle{};

    int _interface{0};
    unsigned char _endpoint_out{EH575_ENDPOINT_OUT};
    unsigned char _endpoint_in{EH575_ENDPOINT_IN};
    bool _claimed{};
    bool _reattach{};

public:
    USBTransport() = default;

    ~USBTransport() {
        close();
    }

    JINX_NO_COPY_NO_MOVE(USBTransport);

    std::error_code open(libusb_context* context, uint16_t vendor, uint16_t product);
    void close();

    bool is_open() const { return _claimed; }

    libusb_device_handle* get_handle() { return _handle.get(); }
    unsigned char get_endpoint_out() const { return _endpoint_out; }
    unsigned char get_endpoint_in() const { return _endpoint_in; }

protected:
    static bool find_endpoints(libusb_device* dev, int& interface, unsigned char& endpoint_in, unsigned char& endpoint_out);
};

/*
    Serves a Transport with bulk transfers. When the pipe is closed the
    input endpoint is read until it runs dry so that a frame cut short
    does not reach the next session.
*/
class USBLink : public jinx::AsyncRoutine {
    USBTransport* _device{};
    Transport* _transport{};

    jinx::posix::MemoryProvider _memory{};
    USBAllocator _allocator{_memory};
    USBBuffer _buffer{};

    TransportRequest _request{};
    TransportReply _reply{};
    bool _draining{};
    size_t _drained{};

    RequestQueue::Get _get_request{};
    ReplyQueue::Put _put_reply{};
    jinx::usb::USBBulkTransfer _bulk_transfer{};

public:
    USBLink() = default;

    JINX_NO_COPY_NO_MOVE(USBLink);

    USBLink& operator ()(USBTransport* device, Transport* transport);

protected:
    void async_finalize() noexcept override;
    jinx::Async handle_error(const jinx::error::Error& error) override;

    std::error_code transfer_error(const jinx::error::Error& error);

    void allocate();

    jinx::Async get_request();
    jinx::Async handle_request();
    jinx::Async sent();
    jinx::Async received();
    jinx::Async put_reply();
    jinx::Async drain();
    jinx::Async drained();
};

}

#endif
