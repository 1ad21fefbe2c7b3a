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
#include <cstring>
#include <iostream>

#include <jinx/logging.hpp>

#include "errors.hpp"
#include "usb_transport.hpp"

namespace egispp {
using namespace jinx;
using namespace jinx::usb;

bool USBTransport::find_endpoints(libusb_device* dev, int& interface, unsigned char& endpoint_in, unsigned char& endpoint_out)
{
    struct libusb_config_descriptor* config_desc{};
    int ret = libusb_get_active_config_descriptor(dev, &config_desc);
    if (ret < 0) {
        return false;
    }

    bool found_in = false;
    bool found_out = false;

    for (int intf_idx = 0 ; intf_idx < config_desc->bNumInterfaces; ++intf_idx) {
        const struct libusb_interface* iface = &config_desc->interface[intf_idx];
        for (int intf_desc_idx = 0 ; intf_desc_idx < iface->num_altsetting; ++intf_desc_idx) {
            const struct libusb_interface_descriptor* iface_desc = &iface->altsetting[intf_desc_idx];
            for (int endp_idx = 0 ; endp_idx < iface_desc->bNumEndpoints; ++endp_idx) {
                const struct libusb_endpoint_descriptor* endp_desc = &iface_desc->endpoint[endp_idx];
                if ((endp_desc->bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) != LIBUSB_TRANSFER_TYPE_BULK) {
                    continue;
                }
                if (endp_desc->bEndpointAddress == endpoint_in) {
                    interface = iface_desc->bInterfaceNumber;
                    found_in = true;
                } else if (endp_desc->bEndpointAddress == endpoint_out) {
                    found_out = true;
                }
            }
        }
    }

    libusb_free_config_descriptor(config_desc);
    return found_in and found_out;
}

std::error_code USBTransport::open(libusb_context* context, uint16_t vendor, uint16_t product)
{
    close();

    libusb_device** devices{};
    ssize_t count = libusb_get_device_list(context, &devices);
    if (count < 0) {
        jinx_log_error() << "libusb_get_device_list: " << libusb_error_name(static_cast<int>(count)) << std::endl;
        return TransportError::Io;
    }

    int ret = LIBUSB_ERROR_NOT_FOUND;
    for (ssize_t idx = 0; idx < count; ++idx) {
        libusb_device_descriptor desc{};
        if (libusb_get_device_descriptor(devices[idx], &desc) != 0) {
            continue;
        }
        if (desc.idVendor == vendor and desc.idProduct == product) {
            ret = libusb_open(devices[idx], _handle.address());
            break;
        }
    }
    libusb_free_device_list(devices, 1);

    if (ret != 0) {
        jinx_log_error() << "unable open device " << std::hex << vendor << ":" << product << std::dec
            << ": " << libusb_error_name(ret) << std::endl;
        return ret == LIBUSB_ERROR_NOT_FOUND ? TransportError::Disconnected : TransportError::Io;
    }

    if (not find_endpoints(libusb_get_device(_handle), _interface, _endpoint_in, _endpoint_out)) {
        jinx_log_error() << "endpoint not found" << std::endl;
        _handle.reset();
        return TransportError::Io;
    }

    if (libusb_kernel_driver_active(_handle, _interface) == 1) {
        ret = libusb_detach_kernel_driver(_handle, _interface);
        if (ret != 0) {
            jinx_log_error() << "libusb_detach_kernel_driver: " << libusb_error_name(ret) << std::endl;
            _handle.reset();
            return TransportError::Io;
        }
        _reattach = true;
    }

    ret = libusb_claim_interface(_handle, _interface);
    if (ret != 0) {
        jinx_log_error() << "libusb_claim_interface: " << libusb_error_name(ret) << std::endl;
        close();
        return TransportError::Io;
    }
    _claimed = true;

    syslog(LOG_INFO, "usb: %04hx:%04hx opened, interface %d", vendor, product, _interface);
    return {};
}

void USBTransport::close()
{
    if (_handle == nullptr) {
        return;
    }

    if (_claimed) {
        (void)libusb_release_interface(_handle, _interface);
        _claimed = false;
    }
    if (_reattach) {
        (void)libusb_attach_kernel_driver(_handle, _interface);
        _reattach = false;
    }
    _handle.reset();
}

USBLink& USBLink::operator ()(USBTransport* device, Transport* transport)
{
    _device = device;
    _transport = transport;
    _draining = false;
    _drained = 0;
    _transport->_served = true;
    async_start(&USBLink::get_request);
    return *this;
}

void USBLink::async_finalize() noexcept
{
    _get_request.reset();
    _put_reply.reset();
    _reply = {};
    _transport->_served = false;
    AsyncRoutine::async_finalize();
}

Async USBLink::handle_error(const error::Error& error)
{
    auto state = AsyncRoutine::handle_error(error);
    if (state != ControlState::Raise) {
        return state;
    }

    if (error.category() == category_awaitable()) {
        if (static_cast<ErrorAwaitable>(error.value()) == ErrorAwaitable::Cancelled) {
            // pipe closed
            if (_draining) {
                return async_return();
            }
            return drain();
        }
        return state;
    }

    if (_draining) {
        if (_drained != 0) {
            syslog(LOG_INFO, "usb: %zu stale transfer(s) drained", _drained);
        }
        return async_return();
    }

    _reply = TransportReply{};
    _reply._error = transfer_error(error);
    return put_reply();
}

std::error_code USBLink::transfer_error(const error::Error& error)
{
    auto endpoint = _request._type == TransportRequest::Send ? _device->get_endpoint_out() : _device->get_endpoint_in();

    if (error.category() == category_transfer()) {
        switch (static_cast<libusb_transfer_status>(error.value())) {
            case LIBUSB_TRANSFER_TIMED_OUT:
                return TransportError::Timeout;
            case LIBUSB_TRANSFER_NO_DEVICE:
                syslog(LOG_INFO, "usb: disconnected");
                return TransportError::Disconnected;
            case LIBUSB_TRANSFER_STALL:
                jinx_log_warning() << "endpoint " << std::hex << static_cast<int>(endpoint) << std::dec
                    << " stalled" << std::endl;
                (void)libusb_clear_halt(_device->get_handle(), endpoint);
                return TransportError::Io;
            default:
                break;
        }
    } else if (error.category() == category_usb()) {
        switch (static_cast<libusb_error>(error.value())) {
            case LIBUSB_ERROR_TIMEOUT:
                return TransportError::Timeout;
            case LIBUSB_ERROR_NO_DEVICE:
                syslog(LOG_INFO, "usb: disconnected");
                return TransportError::Disconnected;
            default:
                break;
        }
    }

    jinx_log_error() << "bulk transfer on " << std::hex << static_cast<int>(endpoint) << std::dec
        << " failed: " << error.value() << std::endl;
    return TransportError::Io;
}

void USBLink::allocate()
{
    _buffer = _allocator.allocate(USBBufferConfig{});
    if (_buffer == nullptr) {
        error::fatal("out of memory");
    }
}

Async USBLink::get_request()
{
    if (_transport->_closed) {
        return drain();
    }
    return *this / _get_request(&_transport->_requests) / &USBLink::handle_request;
}

Async USBLink::handle_request()
{
    _request = std::move(_get_request.get_result());
    _reply = TransportReply{};

    if (not _device->is_open()) {
        _reply._error = TransportError::Disconnected;
        return put_reply();
    }

    allocate();
    auto iobuf = _buffer->slice_for_producer();

    if (_request._type == TransportRequest::Send) {
        if (_request._data.size() > iobuf._size) {
            jinx_log_error() << "request of " << _request._data.size() << " bytes exceeds the transfer buffer" << std::endl;
            _reply._error = TransportError::Io;
            return put_reply();
        }
        memcpy(iobuf.data(), _request._data.data(), _request._data.size());
        iobuf._size = _request._data.size();
        return *this
            / _bulk_transfer(_device->get_handle(), _device->get_endpoint_out(), iobuf, _request._timeout)
            / &USBLink::sent;
    }

    iobuf._size = std::min<size_t>(iobuf._size, _request._max_length);
    return *this
        / _bulk_transfer(_device->get_handle(), _device->get_endpoint_in(), iobuf, _request._timeout)
        / &USBLink::received;
}

Async USBLink::sent()
{
    auto transferred = static_cast<size_t>(_bulk_transfer.get_result());
    if (transferred != _request._data.size()) {
        jinx_log_error() << "short write " << transferred << "/" << _request._data.size() << std::endl;
        _reply._error = TransportError::Io;
    }
    return put_reply();
}

Async USBLink::received()
{
    auto transferred = _bulk_transfer.get_result();
    _buffer->commit(transferred).abort_on(Failed_, "buffer overflow");

    auto buf = _buffer->slice_for_consumer();
    const auto* data = reinterpret_cast<const unsigned char*>(buf.data());
    _reply._data.assign(data, data + buf._size);
    return put_reply();
}

Async USBLink::put_reply()
{
    if (_transport->_closed) {
        return drain();
    }
    return *this
        / _put_reply(&_transport->_replies, std::move(_reply))
        / &USBLink::get_request;
}

Async USBLink::drain()
{
    _draining = true;
    if (not _device->is_open() or _drained >= 64) {
        return async_return();
    }

    allocate();
    auto iobuf = _buffer->slice_for_producer();
    return *this
        / _bulk_transfer(_device->get_handle(), _device->get_endpoint_in(), iobuf, std::chrono::milliseconds(50))
        / &USBLink::drained;
}

Async USBLink::drained()
{
    _drained += 1;
    jinx_log_warning() << "discarded " << _bulk_transfer.get_result() << " stale bytes" << std::endl;
    return drain();
}

}
