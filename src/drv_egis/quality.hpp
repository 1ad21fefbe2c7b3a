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
#ifndef __quality_hpp__
#define __quality_hpp__

#include "image.hpp"

namespace egispp {

enum class Classification {
    Clean,
    Noisy,
    Fingerprint,
    Rejected
};

const char* to_string(Classification classification);

struct QualityThresholds
{
    // below: nothing on the sensor
    float _clean{0.03F};

    // above: a finger
    float _fingerprint{0.15F};
};

struct QualityVerdict
{
    float _non_zero_ratio{};
    Classification _classification{Classification::Rejected};
};

namespace quality {

float non_zero_ratio(const PixelBuffer& buffer);

QualityVerdict classify(float ratio, const QualityThresholds& thresholds);
QualityVerdict classify(const PixelBuffer& buffer, const QualityThresholds& thresholds);

}

}

#endif
