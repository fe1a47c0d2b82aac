//
//
// Copyright the mso-test contributors
//
// SPDX-License-Identifier: MPL-2.0
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <optional>

#include "pixel.hpp"

struct Options
{
    float threshold = 0.1f;             // matching threshold (0 to 1), smaller is more sensitive
    bool include_anti_aliasing = false; // count anti-aliased pixels as differences
    float alpha = 0.1f;                 // opacity of the original image in the diff output
    PixelValues anti_alias_colour = colour_to_pixel[YELLOW];
    PixelValues diff_colour = colour_to_pixel[RED];
    std::optional<PixelValues> diff_colour_alt; // used when the actual image is darker
    bool diff_mask = false;             // draw the diff over a transparent background
    unsigned int thread_count = 1;      // 0 uses every hardware thread

    // Throws InvalidOption when threshold or alpha is outside [0, 1]
    void validate() const;

    // Squared YIQ distance above which two pixels are considered different
    float max_delta() const { return max_yiq_delta * threshold * threshold; }
};
#endif
