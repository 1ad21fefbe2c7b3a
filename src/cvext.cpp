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
#include <iostream>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <jinx/logging.hpp>

#include "cvext.hpp"

namespace cvext {

cv::Mat preview(const cv::Mat& raw, double gamma, int scale)
{
    if (raw.empty() or raw.type() != CV_8UC1 or scale < 1) {
        return {};
    }

    cv::Mat eqh{};
    cv::equalizeHist(raw, eqh);

    cv::Mat gam{};
    cvext::gamma<unsigned char>(eqh, gam, gamma);

    cv::Mat img{};
    cv::resize(gam, img, {raw.cols * scale, raw.rows * scale});
    return img;
}

bool write_preview(const std::string& filename, const cv::Mat& raw)
{
    auto img = preview(raw);
    if (img.empty()) {
        return false;
    }

    try {
        return cv::imwrite(filename, img);
    } catch (const cv::Exception& e) {
        jinx_log_error() << "imwrite " << filename << ": " << e.what() << std::endl;
        return false;
    }
}

}
