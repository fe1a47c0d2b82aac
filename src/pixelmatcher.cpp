//
//
// Copyright the mso-test contributors
//
// SPDX-License-Identifier: MPL-2.0
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <algorithm>
#include <cmath>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "antialias.hpp"
#include "errors.hpp"
#include "pixelmatcher.hpp"

double DiffResult::error_percentage() const
{
    if (total_pixels == 0)
    {
        return 0.0;
    }
    return 100.0 * static_cast<double>(differing_pixels) / static_cast<double>(total_pixels);
}

DiffResult &DiffResult::operator+=(const DiffResult &other)
{
    differing_pixels += other.differing_pixels;
    anti_aliased_pixels += other.anti_aliased_pixels;
    total_pixels += other.total_pixels;
    return *this;
}

DiffResult PixelMatcher::compare(const PixelBuffer &expected, const PixelBuffer &actual, PixelBuffer *diff,
                                 const Options &options)
{
    options.validate();
    check_dimensions(expected, actual, diff);

    int width = expected.get_width();
    int height = expected.get_height();

    // Identical images only need the faded background
    if (expected.get_data() == actual.get_data())
    {
        if (diff != nullptr)
        {
            for (int y = 0; y < height; y++)
            {
                for (int x = 0; x < width; x++)
                {
                    diff->set_pixel(x, y, composite_pixel(PixelComparison(), expected.get_pixel(x, y), options));
                }
            }
        }
        DiffResult result;
        result.total_pixels = expected.get_pixel_count();
        return result;
    }

    unsigned int workers = worker_count(options, height);
    if (workers <= 1)
    {
        return compare_rows(expected, actual, diff, options, 0, height);
    }

    // Each worker owns a band of rows and its own result, merged after joining
    int band_height = (height + static_cast<int>(workers) - 1) / static_cast<int>(workers);
    int band_count = (height + band_height - 1) / band_height;
    std::vector<DiffResult> partial_results(band_count);
    std::vector<std::thread> threads;
    threads.reserve(band_count);

    auto run_band = [&](int band)
    {
        int first_row = band * band_height;
        int last_row = std::min(height, first_row + band_height);
        partial_results[band] = compare_rows(expected, actual, diff, options, first_row, last_row);
    };

    // band 0 always runs on the calling thread
    int next_band = 1;
    for (; next_band < band_count; next_band++)
    {
        try
        {
            threads.emplace_back(run_band, next_band);
        }
        catch (const std::system_error &)
        {
            // out of threads, the remaining bands run on the calling thread
            break;
        }
    }

    try
    {
        run_band(0);
        for (; next_band < band_count; next_band++)
        {
            run_band(next_band);
        }
    }
    catch (...)
    {
        join_all(threads);
        throw;
    }
    join_all(threads);

    DiffResult result;
    for (const auto &partial : partial_results)
    {
        result += partial;
    }
    return result;
}

PixelComparison PixelMatcher::classify_pixel(const PixelBuffer &expected, const PixelBuffer &actual, int x, int y,
                                             const Options &options, float max_delta)
{
    PixelComparison comparison;

    PixelValues expected_pixel = expected.get_pixel(x, y);
    PixelValues actual_pixel = actual.get_pixel(x, y);
    if (expected_pixel == actual_pixel)
    {
        return comparison;
    }

    comparison.delta = Pixel::colour_delta(expected_pixel, actual_pixel, false);
    if (std::abs(comparison.delta) <= max_delta)
    {
        return comparison;
    }

    // check if it's a real rendering difference or just anti-aliasing in either image
    if (!options.include_anti_aliasing &&
        (AntiAliasDetector::is_antialiased(expected, x, y, actual) ||
         AntiAliasDetector::is_antialiased(actual, x, y, expected)))
    {
        comparison.classification = PixelClass::ANTI_ALIASED;
    }
    else
    {
        comparison.classification = PixelClass::DIFFERENT;
    }
    return comparison;
}

PixelValues PixelMatcher::composite_pixel(const PixelComparison &comparison, PixelValues original, const Options &options)
{
    if (comparison.classification == PixelClass::DIFFERENT)
    {
        if (comparison.delta < 0.0f && options.diff_colour_alt)
        {
            return *options.diff_colour_alt;
        }
        return options.diff_colour;
    }

    // masks only show the differences that are counted
    if (options.diff_mask)
    {
        return colour_to_pixel[TRANSPARENT];
    }

    if (comparison.classification == PixelClass::ANTI_ALIASED)
    {
        return options.anti_alias_colour;
    }
    return Pixel::gray_pixel(original, options.alpha);
}

void PixelMatcher::check_dimensions(const PixelBuffer &expected, const PixelBuffer &actual, const PixelBuffer *diff)
{
    if (!expected.same_size(actual))
    {
        throw DimensionMismatch("Image sizes do not match: " + std::to_string(expected.get_width()) + "x" +
                                std::to_string(expected.get_height()) + " vs " + std::to_string(actual.get_width()) +
                                "x" + std::to_string(actual.get_height()));
    }
    if (diff != nullptr && !diff->same_size(expected))
    {
        throw DimensionMismatch("Diff image size " + std::to_string(diff->get_width()) + "x" +
                                std::to_string(diff->get_height()) + " does not match the compared images");
    }
}

DiffResult PixelMatcher::compare_rows(const PixelBuffer &expected, const PixelBuffer &actual, PixelBuffer *diff,
                                      const Options &options, int first_row, int last_row)
{
    float max_delta = options.max_delta();
    int width = expected.get_width();
    DiffResult result;

    for (int y = first_row; y < last_row; y++)
    {
        for (int x = 0; x < width; x++)
        {
            PixelComparison comparison = classify_pixel(expected, actual, x, y, options, max_delta);

            if (comparison.classification == PixelClass::DIFFERENT)
            {
                result.differing_pixels++;
            }
            else if (comparison.classification == PixelClass::ANTI_ALIASED)
            {
                result.anti_aliased_pixels++;
            }

            if (diff != nullptr)
            {
                diff->set_pixel(x, y, composite_pixel(comparison, expected.get_pixel(x, y), options));
            }
        }
    }
    result.total_pixels = static_cast<std::size_t>(width) * (last_row - first_row);
    return result;
}

unsigned int PixelMatcher::worker_count(const Options &options, int height)
{
    unsigned int workers = options.thread_count;
    if (workers == 0)
    {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    return std::min(workers, static_cast<unsigned int>(std::max(height, 1)));
}

void PixelMatcher::join_all(std::vector<std::thread> &threads)
{
    for (auto &thread : threads)
    {
        thread.join();
    }
}
