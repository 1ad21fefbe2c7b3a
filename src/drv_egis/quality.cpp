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
#include "quality.hpp"

namespace egispp {

const char* to_string(Classification classification)
{
    switch (classification) {
        case Classification::Clean:
            return "clean";
        case Classification::Noisy:
            return "noisy";
        case Classification::Fingerprint:
            return "fingerprint";
        case Classification::Rejected:
            return "rejected";
    }
    return "unknown";
}

namespace quality {

float non_zero_ratio(const PixelBuffer& buffer)
{
    if (buffer.empty()) {
        return 0.0F;
    }
    auto count = cv::countNonZero(buffer._pixels);
    return static_cast<float>(static_cast<double>(count) / static_cast<double>(buffer.size()));
}

QualityVerdict classify(float ratio, const QualityThresholds& thresholds)
{
    QualityVerdict verdict{ratio, Classification::Noisy};
    if (ratio > thresholds._fingerprint) {
        verdict._classification = Classification::Fingerprint;
    } else if (ratio < thresholds._clean) {
        verdict._classification = Classification::Clean;
    }
    return verdict;
}

QualityVerdict classify(const PixelBuffer& buffer, const QualityThresholds& thresholds)
{
    if (buffer.empty() or buffer._pixels.type() != CV_8UC1) {
        return QualityVerdict{0.0F, Classification::Rejected};
    }
    return classify(non_zero_ratio(buffer), thresholds);
}

}

}
