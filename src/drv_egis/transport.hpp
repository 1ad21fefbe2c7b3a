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
#ifndef __transport_hpp__
#define __transport_hpp__

#include <chrono>
#include <queue>
#include <system_error>

#include <jinx/queue.hpp>

#include "frame.hpp"

namespace egispp {

struct TransportRequest
{
    enum {
        Send,
        Receive
    } _type{Send};

    Bytes _data{};

    // receive only
    size_t _max_length{};
    std::chrono::milliseconds _timeout{};
};

/*
    Errors are reported in category_transport():
    Timeout when nothing arrived in time, Disconnected when the device is gone.
*/
struct TransportReply
{
    std::error_code _error{};
    Bytes _data{};
};

typedef jinx::Queue<std::queue<TransportRequest>> RequestQueue;
typedef jinx::Queue<std::queue<TransportReply>> ReplyQueue;

/*
    Half-duplex byte pipe to the sensor. The sequencer puts one request and
    waits for its reply before the next; a link routine (USB or test) serves
    the other end. Closing the pipe wakes both sides.
*/
struct Transport
{
    RequestQueue _requests{0};
    ReplyQueue _replies{0};

    // set while a link routine serves the pipe
    bool _served{};
    bool _closed{};

    void close() {
        _closed = true;
        _requests.reset();
        _replies.reset();
    }
};

}

#endif
