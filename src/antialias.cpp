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

#include "antialias.hpp"
#include "pixel.hpp"

bool AntiAliasDetector::is_antialiased(const PixelBuffer &image, int x, int y, const PixelBuffer &other)
{
    // neighbours outside of the image are skipped
    int x0 = std::max(x - 1, 0);
    int y0 = std::max(y - 1, 0);
    int x2 = std::min(x + 1, image.get_width() - 1);
    int y2 = std::min(y + 1, image.get_height() - 1);

    PixelValues center = image.get_pixel(x, y);

    int zeroes = 0;
    float min = 0.0f;
    float max = 0.0f;
    int min_x = 0;
    int min_y = 0;
    int max_x = 0;
    int max_y = 0;

    for (int adjacent_x = x0; adjacent_x <= x2; adjacent_x++)
    {
        for (int adjacent_y = y0; adjacent_y <= y2; adjacent_y++)
        {
            if (adjacent_x == x && adjacent_y == y)
                continue;

            // brightness delta between the center pixel and the adjacent one
            float delta = Pixel::colour_delta(center, image.get_pixel(adjacent_x, adjacent_y), true);

            if (delta == 0.0f)
            {
                zeroes++;
                // more than 2 equal siblings means a flat area, not anti-aliasing
                if (zeroes > 2)
                {
                    return false;
                }
            }
            else if (delta < min)
            {
                min = delta;
                min_x = adjacent_x;
                min_y = adjacent_y;
            }
            else if (delta > max)
            {
                max = delta;
                max_x = adjacent_x;
                max_y = adjacent_y;
            }
        }
    }

    // no brighter or no darker neighbours, so the pixel is not on a slope
    if (min == 0.0f || max == 0.0f)
    {
        return false;
    }

    // the darkest or brightest neighbour sitting in a flat area of both images makes this pixel an edge step
    return (has_many_siblings(image, min_x, min_y) && has_many_siblings(other, min_x, min_y)) ||
           (has_many_siblings(image, max_x, max_y) && has_many_siblings(other, max_x, max_y));
}

bool AntiAliasDetector::has_many_siblings(const PixelBuffer &image, int x, int y)
{
    int x0 = std::max(x - 1, 0);
    int y0 = std::max(y - 1, 0);
    int x2 = std::min(x + 1, image.get_width() - 1);
    int y2 = std::min(y + 1, image.get_height() - 1);

    PixelValues center = image.get_pixel(x, y);
    int zeroes = 0;

    for (int adjacent_x = x0; adjacent_x <= x2; adjacent_x++)
    {
        for (int adjacent_y = y0; adjacent_y <= y2; adjacent_y++)
        {
            if (adjacent_x == x && adjacent_y == y)
                continue;

            if (image.get_pixel(adjacent_x, adjacent_y) == center)
            {
                zeroes++;
            }

            if (zeroes > 2)
            {
                return true;
            }
        }
    }
    return false;
}
