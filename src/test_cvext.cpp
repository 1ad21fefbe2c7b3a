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
#include <gtest/gtest.h>

#include "cvext.hpp"

TEST(Cvext, GammaKeepsEndpoints)
{
    cv::Mat input{cv::Size{2, 1}, CV_8UC1};
    input.at<unsigned char>(0, 0) = 0;
    input.at<unsigned char>(0, 1) = 255;

    cv::Mat output{};
    cvext::gamma<unsigned char>(input, output, 1.5);
    EXPECT_EQ(output.at<unsigned char>(0, 0), 0);
    EXPECT_EQ(output.at<unsigned char>(0, 1), 255);
}

TEST(Cvext, GammaDarkensMidtones)
{
    cv::Mat input{cv::Size{1, 1}, CV_8UC1};
    input.at<unsigned char>(0, 0) = 128;

    cv::Mat output{};
    cvext::gamma<unsigned char>(input, output, 1.5);
    EXPECT_LT(output.at<unsigned char>(0, 0), 128);
}

TEST(Cvext, PreviewUpscales)
{
    cv::Mat raw{cv::Size{103, 52}, CV_8UC1};
    cv::RNG rng{3};
    rng.fill(raw, cv::RNG::UNIFORM, cv::Scalar{0}, cv::Scalar{256});

    auto img = cvext::preview(raw);
    EXPECT_EQ(img.cols, 206);
    EXPECT_EQ(img.rows, 104);
    EXPECT_EQ(img.type(), CV_8UC1);
}

TEST(Cvext, PreviewRejectsEmpty)
{
    EXPECT_TRUE(cvext::preview(cv::Mat{}).empty());

    cv::Mat color{cv::Size{4, 4}, CV_8UC3};
    EXPECT_TRUE(cvext::preview(color).empty());
}
