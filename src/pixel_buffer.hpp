//
//
// Copyright the mso-test contributors
//
// SPDX-License-Identifier: MPL-2.0
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef PIXEL_BUFFER_HPP
#define PIXEL_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "pixel.hpp"

// Row-major RGBA pixels, top row first
class PixelBuffer
{
public:
    PixelBuffer(int width, int height);
    PixelBuffer(int width, int height, std::vector<std::uint8_t> data);
    PixelBuffer(int width, int height, PixelValues fill);

    int get_width() const { return m_width; }
    int get_height() const { return m_height; }
    std::size_t get_pixel_count() const { return static_cast<std::size_t>(m_width) * m_height; }
    const std::vector<std::uint8_t> &get_data() const { return m_data; }

    bool contains(int x, int y) const { return x >= 0 && x < m_width && y >= 0 && y < m_height; }
    bool same_size(const PixelBuffer &other) const { return m_width == other.m_width && m_height == other.m_height; }

    // Byte offset of the pixel at (x, y), throws std::out_of_range outside the buffer
    std::size_t index(int x, int y) const;

    PixelValues get_pixel(int x, int y) const { return Pixel::get_rgba(&m_data[index(x, y)]); }
    void set_pixel(int x, int y, PixelValues rgba);
    void fill(PixelValues rgba);

    bool operator==(const PixelBuffer &other) const = default;

private:
    int m_width = 0;
    int m_height = 0;
    std::vector<std::uint8_t> m_data;
};
#endif
