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
#ifndef __eh575_hpp__
#define __eh575_hpp__

#define EH575_VENDOR 0x1c7a
#define EH575_PRODUCT 0x0576

#define EH575_ENDPOINT_OUT 0x01
#define EH575_ENDPOINT_IN 0x82

// 103 x 52 = 5356
#define SENSOR_WIDTH 103
#define SENSOR_HEIGHT 52

// opcode families, first byte after the magic
enum eh575_opcode {
    op_reset = 0x60,
    op_register = 0x61,
    op_query = 0x62,
    op_configure = 0x63,
    op_capture = 0x64,
    op_background = 0x73
};

#endif
