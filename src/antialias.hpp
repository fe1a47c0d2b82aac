//
//
// Copyright the mso-test contributors
//
// SPDX-License-Identifier: MPL-2.0
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef ANTIALIAS_HPP
#define ANTIALIAS_HPP

#include "pixel_buffer.hpp"

// Decides whether a differing pixel is part of an anti-aliased edge, based on the
// "Anti-aliased Pixel and Intensity Slope Detector" paper by V. Vysniauskas, 2009
class AntiAliasDetector
{
public:
    // Checks the pixel at (x, y) of image, the other image is the one it is being compared with
    static bool is_antialiased(const PixelBuffer &image, int x, int y, const PixelBuffer &other);

    // True when at least 3 neighbours of (x, y) have exactly the same colour
    static bool has_many_siblings(const PixelBuffer &image, int x, int y);
};
#endif
