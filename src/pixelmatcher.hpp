//
//
// Copyright the mso-test contributors
//
// SPDX-License-Identifier: MPL-2.0
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef PIXELMATCHER_HPP
#define PIXELMATCHER_HPP

#include <cstddef>
#include <thread>
#include <vector>

#include "options.hpp"
#include "pixel.hpp"
#include "pixel_buffer.hpp"

enum class PixelClass
{
    MATCH,
    ANTI_ALIASED,
    DIFFERENT
};

struct PixelComparison
{
    PixelClass classification = PixelClass::MATCH;
    float delta = 0.0f; // signed YIQ delta, negative when the expected pixel is brighter
};

struct DiffResult
{
    std::size_t differing_pixels = 0;
    std::size_t anti_aliased_pixels = 0; // above the threshold but not counted as differing
    std::size_t total_pixels = 0;

    double error_percentage() const;
    DiffResult &operator+=(const DiffResult &other);
};

// PixelMatcher compares two images pixel by pixel and optionally draws a diff image
class PixelMatcher
{
public:
    // Counts the pixels that differ between expected and actual. When diff is not null every one of
    // its pixels is overwritten with the visualisation. Throws InvalidOption or DimensionMismatch
    // before any pixel is looked at.
    static DiffResult compare(const PixelBuffer &expected, const PixelBuffer &actual, PixelBuffer *diff,
                              const Options &options = Options());

    static PixelComparison classify_pixel(const PixelBuffer &expected, const PixelBuffer &actual, int x, int y,
                                          const Options &options, float max_delta);

    static PixelValues composite_pixel(const PixelComparison &comparison, PixelValues original, const Options &options);

private:
    static void check_dimensions(const PixelBuffer &expected, const PixelBuffer &actual, const PixelBuffer *diff);
    static DiffResult compare_rows(const PixelBuffer &expected, const PixelBuffer &actual, PixelBuffer *diff,
                                   const Options &options, int first_row, int last_row);
    static unsigned int worker_count(const Options &options, int height);
    static void join_all(std::vector<std::thread> &threads);
};
#endif
