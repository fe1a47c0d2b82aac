//
//
// Copyright the mso-test contributors
//
// SPDX-License-Identifier: MPL-2.0
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef PIXEL_HPP
#define PIXEL_HPP

#include <array>
#include <cstdint>

constexpr int pixel_stride = 4;
using PixelValues = std::array<std::uint8_t, pixel_stride>; // R, G, B, A

enum Colour {
    RED,
    YELLOW,
    BLACK,
    WHITE,
    TRANSPARENT,
    COLOUR_COUNT
};

static constexpr PixelValues colour_to_pixel[COLOUR_COUNT] = {
    {255, 0, 0, 255}, // RED
    {255, 255, 0, 255}, // YELLOW
    {0, 0, 0, 255}, // BLACK
    {255, 255, 255, 255}, // WHITE
    {0, 0, 0, 0} // TRANSPARENT
};

// 35215 is the maximum possible value for the YIQ difference metric (red against cyan)
constexpr float max_yiq_delta = 35215.0f;

struct Pixel
{
    static PixelValues get_rgba(const std::uint8_t *src)
    {
        return {src[0], src[1], src[2], src[3]};
    }

    // Colour space conversion from "Measuring perceived color difference using YIQ NTSC
    // transmission color space in mobile applications" by Y. Kotsarenko and F. Ramos
    static float rgb2y(float r, float g, float b)
    {
        return r * 0.29889531f + g * 0.58662247f + b * 0.11448223f;
    }

    static float rgb2i(float r, float g, float b)
    {
        return r * 0.59597799f - g * 0.27417610f - b * 0.32180189f;
    }

    static float rgb2q(float r, float g, float b)
    {
        return r * 0.21147017f - g * 0.52261711f + b * 0.31114694f;
    }

    // blend a semi-transparent channel with white
    static float blend(float c, float a)
    {
        return 255.0f + (c - 255.0f) * a;
    }

    // Perceptual squared distance between two pixels. With y_only the signed brightness
    // difference is returned instead. The full delta is negative when the first pixel is brighter.
    static float colour_delta(PixelValues first, PixelValues second, bool y_only)
    {
        if (first == second)
        {
            return 0.0f;
        }

        float r1 = first[0];
        float g1 = first[1];
        float b1 = first[2];
        float r2 = second[0];
        float g2 = second[1];
        float b2 = second[2];

        if (first[3] < 255)
        {
            float a1 = first[3] / 255.0f;
            r1 = blend(r1, a1);
            g1 = blend(g1, a1);
            b1 = blend(b1, a1);
        }

        if (second[3] < 255)
        {
            float a2 = second[3] / 255.0f;
            r2 = blend(r2, a2);
            g2 = blend(g2, a2);
            b2 = blend(b2, a2);
        }

        float y1 = rgb2y(r1, g1, b1);
        float y2 = rgb2y(r2, g2, b2);
        float y = y1 - y2;

        if (y_only)
        {
            return y;
        }

        float i = rgb2i(r1, g1, b1) - rgb2i(r2, g2, b2);
        float q = rgb2q(r1, g1, b1) - rgb2q(r2, g2, b2);

        float delta = 0.5053f * y * y + 0.299f * i * i + 0.1957f * q * q;

        return y1 > y2 ? -delta : delta;
    }

    // Matched pixels are drawn as the original's luma, faded towards white by alpha
    static PixelValues gray_pixel(PixelValues original, float alpha)
    {
        float luma = rgb2y(original[0], original[1], original[2]);
        auto value = static_cast<std::uint8_t>(blend(luma, alpha * original[3] / 255.0f));
        return {value, value, value, 255};
    }
};
#endif
