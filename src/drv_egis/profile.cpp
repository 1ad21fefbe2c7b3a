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
#include <filesystem>
#include <iostream>

#include <jinx/logging.hpp>

#include "eh575.hpp"
#include "errors.hpp"
#include "profile.hpp"

namespace egispp {
using namespace std::chrono_literals;

static CommandSpec small(unsigned char opcode, Bytes params, std::chrono::milliseconds delay, const char* label)
{
    return CommandSpec{opcode, std::move(params), ResponseSize::Small, 0, {}, delay, label};
}

static CommandSpec chunked(unsigned char opcode, Bytes params, std::chrono::milliseconds delay, const char* label)
{
    return CommandSpec{opcode, std::move(params), ResponseSize::Chunked, SENSOR_WIDTH * SENSOR_HEIGHT, {}, delay, label};
}

DeviceProfile DeviceProfile::eh575()
{
    DeviceProfile profile{};
    profile._name = "eh575";
    profile._vendor = EH575_VENDOR;
    profile._product = EH575_PRODUCT;
    profile._geometry = ImageGeometry{SENSOR_WIDTH, SENSOR_HEIGHT};

    // sensor reset and register setup
    profile._pre_init = {
        small(op_reset, {0x00, 0x00}, 300ms, "pre_init 1"),
        small(op_reset, {0x01, 0x00}, 300ms, "pre_init 2"),
        small(op_register, {0x0a, 0xfd}, 300ms, "pre_init 3"),
        small(op_register, {0x35, 0x02}, 300ms, "pre_init 4"),
        small(op_register, {0x80, 0x00}, 300ms, "pre_init 5"),
        small(op_reset, {0x80, 0x00}, 300ms, "pre_init 6"),
        small(op_register, {0x0a, 0xfc}, 300ms, "pre_init 7"),
        small(op_configure, {0x01, 0x02, 0x0f, 0x03}, 300ms, "pre_init 8"),
        small(op_register, {0x0c, 0x22}, 300ms, "pre_init 9"),
        small(op_register, {0x09, 0x83}, 300ms, "pre_init 10"),
        small(op_configure, {0x26, 0x06, 0x06, 0x60, 0x06, 0x05, 0x2f, 0x06}, 300ms, "pre_init 11"),
        small(op_register, {0x0a, 0xf4}, 300ms, "pre_init 12"),
        small(op_register, {0x0c, 0x44}, 300ms, "pre_init 13"),
        small(op_register, {0x50, 0x03}, 300ms, "pre_init 14"),
        small(op_reset, {0x50, 0x03}, 300ms, "pre_init 15"),
        chunked(op_background, {0x14, 0xec}, 300ms, "pre_init 16"),
        small(op_reset, {0x40, 0xec}, 300ms, "pre_init 17"),
        small(op_configure, {0x09, 0x0b, 0x83, 0x24, 0x00, 0x44, 0x0f, 0x08, 0x20, 0x20, 0x01, 0x05, 0x12}, 300ms, "pre_init 18"),
        small(op_configure, {0x26, 0x06, 0x06, 0x60, 0x06, 0x05, 0x2f, 0x06}, 300ms, "pre_init 19"),
        small(op_register, {0x23, 0x00}, 300ms, "pre_init 20"),
        small(op_register, {0x24, 0x33}, 300ms, "pre_init 21"),
        small(op_register, {0x20, 0x00}, 300ms, "pre_init 22"),
        small(op_register, {0x21, 0x66}, 300ms, "pre_init 23"),
        small(op_reset, {0x00, 0x66}, 300ms, "pre_init 24"),
        small(op_reset, {0x01, 0x66}, 300ms, "pre_init 25"),
        small(op_reset, {0x40, 0x66}, 300ms, "pre_init 26"),
        small(op_register, {0x0c, 0x22}, 300ms, "pre_init 27"),
        small(op_register, {0x0b, 0x03}, 300ms, "pre_init 28"),
        small(op_register, {0x0a, 0xfc}, 300ms, "pre_init 29"),
    };

    profile._post_init = {
        small(op_reset, {0x00, 0xfc}, 200ms, "post_init 1"),
        small(op_reset, {0x01, 0xfc}, 200ms, "post_init 2"),
        small(op_reset, {0x40, 0xfc}, 200ms, "post_init 3"),
        small(op_configure, {0x09, 0x0b, 0x83, 0x24, 0x00, 0x44, 0x0f, 0x08, 0x20, 0x20, 0x01, 0x05, 0x12}, 200ms, "post_init 4"),
        small(op_configure, {0x26, 0x06, 0x06, 0x60, 0x06, 0x05, 0x2f, 0x06}, 200ms, "post_init 5"),
        small(op_register, {0x23, 0x00}, 200ms, "post_init 6"),
        small(op_register, {0x24, 0x33}, 200ms, "post_init 7"),
        small(op_register, {0x20, 0x00}, 200ms, "post_init 8"),
        small(op_register, {0x21, 0x66}, 200ms, "post_init 9"),
        small(op_reset, {0x00, 0x66}, 200ms, "post_init 10"),
        small(op_reset, {0x01, 0x66}, 200ms, "post_init 11"),
        small(op_configure, {0x2c, 0x02, 0x00, 0x57}, 200ms, "post_init 12"),
        small(op_reset, {0x2d, 0x02}, 200ms, "post_init 13"),
        small(op_query, {0x67, 0x03}, 200ms, "post_init 14"),
        small(op_reset, {0x0f, 0x03}, 200ms, "post_init 15"),
        small(op_configure, {0x2c, 0x02, 0x00, 0x13}, 200ms, "post_init 16"),
        small(op_reset, {0x00, 0x02}, 200ms, "post_init 17"),
        chunked(op_capture, {0x14, 0xec}, 200ms, "post_init 18"),
    };

    profile._background = chunked(op_background, {0x14, 0xec}, 100ms, "background");

    profile._repeat = {
        small(op_register, {0x2d, 0x20}, 100ms, "repeat 1"),
        small(op_reset, {0x00, 0x20}, 100ms, "repeat 2"),
        small(op_reset, {0x01, 0x20}, 100ms, "repeat 3"),
        small(op_configure, {0x2c, 0x02, 0x00, 0x57}, 100ms, "repeat 4"),
        small(op_reset, {0x2d, 0x02}, 100ms, "repeat 5"),
        small(op_query, {0x67, 0x03}, 100ms, "repeat 6"),
        small(op_configure, {0x2c, 0x02, 0x00, 0x13}, 100ms, "repeat 7"),
        small(op_reset, {0x00, 0x02}, 100ms, "repeat 8"),
        chunked(op_capture, {0x14, 0xec}, 100ms, "repeat 9"),
    };

    return profile;
}

void DeviceProfile::apply_checksums()
{
    auto stamp = [&](CommandSpec& command) {
        auto iter = _checksums.find(command._opcode);
        if (iter != _checksums.end()) {
            command._checksum = iter->second;
        }
    };

    for (auto& command : _pre_init) {
        stamp(command);
    }
    for (auto& command : _post_init) {
        stamp(command);
    }
    stamp(_background);
    for (auto& command : _repeat) {
        stamp(command);
    }
}

bool DeviceProfile::find_capture(size_t& index) const
{
    for (size_t idx = _repeat.size(); idx > 0; --idx) {
        if (_repeat[idx - 1]._response == ResponseSize::Chunked) {
            index = idx - 1;
            return true;
        }
    }
    return false;
}

std::error_code DeviceProfile::validate() const
{
    if (_geometry._width <= 0 or _geometry._height <= 0) {
        jinx_log_error() << "profile " << _name << ": invalid geometry" << std::endl;
        return CalibrationError::InvalidState;
    }

    if (_background._response != ResponseSize::Chunked or _background._response_length != _geometry.size()) {
        jinx_log_error() << "profile " << _name << ": background command must return a full image" << std::endl;
        return CalibrationError::InvalidState;
    }

    size_t index = 0;
    if (not find_capture(index) or _repeat[index]._response_length != _geometry.size()) {
        jinx_log_error() << "profile " << _name << ": repeat list has no image capture" << std::endl;
        return CalibrationError::InvalidState;
    }
    return {};
}

static void read_command(const cv::FileNode& node, CommandSpec& command)
{
    command._opcode = static_cast<unsigned char>((int)node["opcode"]);

    std::vector<int> params{};
    node["params"] >> params;
    command._params.assign(params.begin(), params.end());

    command._response = node["response"].string() == "chunked" ? ResponseSize::Chunked : ResponseSize::Small;
    command._response_length = static_cast<size_t>(std::max(0, (int)node["length"]));
    command._delay = std::chrono::milliseconds{std::max(0, (int)node["delay"])};
    command._label = node["label"].string();

    command._checksum.reset();
    if (not node["checksum"].empty()) {
        command._checksum = static_cast<unsigned char>((int)node["checksum"]);
    }
}

static void read_commands(const cv::FileNode& node, CommandList& commands)
{
    commands.clear();
    for (auto iter = node.begin(); iter != node.end(); ++iter) {
        CommandSpec command{};
        read_command(*iter, command);
        commands.emplace_back(std::move(command));
    }
}

static void write_command(cv::FileStorage& fstorage, const CommandSpec& command)
{
    std::vector<int> params(command._params.begin(), command._params.end());

    fstorage << "{";
    fstorage << "opcode" << static_cast<int>(command._opcode);
    fstorage << "params" << params;
    fstorage << "response" << (command._response == ResponseSize::Chunked ? "chunked" : "small");
    fstorage << "length" << static_cast<int>(command._response_length);
    fstorage << "delay" << static_cast<int>(command._delay.count());
    fstorage << "label" << command._label;
    if (command._checksum.has_value()) {
        fstorage << "checksum" << static_cast<int>(*command._checksum);
    }
    fstorage << "}";
}

static void write_commands(cv::FileStorage& fstorage, const char* name, const CommandList& commands)
{
    fstorage << name << "[";
    for (const auto& command : commands) {
        write_command(fstorage, command);
    }
    fstorage << "]";
}

std::error_code DeviceProfile::load(const std::string& filename)
{
    if (not std::filesystem::exists(filename)) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    cv::FileStorage fstorage{filename, cv::FileStorage::READ};
    if (not fstorage.isOpened()) {
        jinx_log_error() << "read " << filename << " failed" << std::endl;
        return std::make_error_code(std::errc::io_error);
    }

    // missing keys keep the current values
    if (not fstorage["name"].empty()) {
        _name = fstorage["name"].string();
    }
    if (not fstorage["vendor"].empty()) {
        _vendor = static_cast<uint16_t>((int)fstorage["vendor"]);
    }
    if (not fstorage["product"].empty()) {
        _product = static_cast<uint16_t>((int)fstorage["product"]);
    }
    if (not fstorage["width"].empty()) {
        _geometry._width = (int)fstorage["width"];
    }
    if (not fstorage["height"].empty()) {
        _geometry._height = (int)fstorage["height"];
    }
    if (not fstorage["pre_init"].empty()) {
        read_commands(fstorage["pre_init"], _pre_init);
    }
    if (not fstorage["post_init"].empty()) {
        read_commands(fstorage["post_init"], _post_init);
    }
    if (not fstorage["background"].empty()) {
        read_command(fstorage["background"], _background);
    }
    if (not fstorage["repeat"].empty()) {
        read_commands(fstorage["repeat"], _repeat);
    }
    if (not fstorage["checksums"].empty()) {
        _checksums.clear();
        auto node = fstorage["checksums"];
        for (auto iter = node.begin(); iter != node.end(); ++iter) {
            auto opcode = static_cast<unsigned char>((int)(*iter)["opcode"]);
            auto value = static_cast<unsigned char>((int)(*iter)["value"]);
            _checksums[opcode] = value;
        }
    }

    apply_checksums();
    return validate();
}

std::error_code DeviceProfile::save(const std::string& filename) const
{
    cv::FileStorage fstorage{filename, cv::FileStorage::WRITE};
    if (not fstorage.isOpened()) {
        jinx_log_error() << "write " << filename << " failed" << std::endl;
        return std::make_error_code(std::errc::io_error);
    }

    fstorage << "name" << _name;
    fstorage << "vendor" << static_cast<int>(_vendor);
    fstorage << "product" << static_cast<int>(_product);
    fstorage << "width" << _geometry._width;
    fstorage << "height" << _geometry._height;

    write_commands(fstorage, "pre_init", _pre_init);
    write_commands(fstorage, "post_init", _post_init);

    fstorage << "background";
    write_command(fstorage, _background);

    write_commands(fstorage, "repeat", _repeat);

    fstorage << "checksums" << "[";
    for (const auto& pair : _checksums) {
        fstorage << "{" << "opcode" << static_cast<int>(pair.first) << "value" << static_cast<int>(pair.second) << "}";
    }
    fstorage << "]";

    fstorage.release();
    return {};
}

}
