//
//
// Copyright the mso-test contributors
//
// SPDX-License-Identifier: MPL-2.0
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <stdexcept>
#include <string>
#include <utility>

#include "errors.hpp"
#include "pixel_buffer.hpp"

static void check_dimensions(int width, int height)
{
    if (width < 0 || height < 0)
    {
        throw DimensionMismatch("Image width and height must not be negative, got " +
                                std::to_string(width) + "x" + std::to_string(height));
    }
}

PixelBuffer::PixelBuffer(int width, int height)
    : m_width(width), m_height(height)
{
    check_dimensions(width, height);
    m_data.resize(get_pixel_count() * pixel_stride, 0);
}

PixelBuffer::PixelBuffer(int width, int height, std::vector<std::uint8_t> data)
    : m_width(width), m_height(height), m_data(std::move(data))
{
    check_dimensions(width, height);
    if (m_data.size() != get_pixel_count() * pixel_stride)
    {
        throw DimensionMismatch("Image data size " + std::to_string(m_data.size()) + " does not match " +
                                std::to_string(width) + "x" + std::to_string(height));
    }
}

PixelBuffer::PixelBuffer(int width, int height, PixelValues fill_value)
    : PixelBuffer(width, height)
{
    fill(fill_value);
}

std::size_t PixelBuffer::index(int x, int y) const
{
    if (!contains(x, y))
    {
        throw std::out_of_range("Pixel (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") is outside of a " + std::to_string(m_width) + "x" +
                                std::to_string(m_height) + " image");
    }
    return (static_cast<std::size_t>(y) * m_width + x) * pixel_stride;
}

void PixelBuffer::set_pixel(int x, int y, PixelValues rgba)
{
    std::size_t offset = index(x, y);
    for (int i = 0; i < pixel_stride; i++)
    {
        m_data[offset + i] = rgba[i];
    }
}

void PixelBuffer::fill(PixelValues rgba)
{
    for (std::size_t offset = 0; offset < m_data.size(); offset += pixel_stride)
    {
        for (int i = 0; i < pixel_stride; i++)
        {
            m_data[offset + i] = rgba[i];
        }
    }
}
