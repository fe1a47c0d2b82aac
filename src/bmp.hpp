//
//
// Copyright the mso-test contributors
//
// SPDX-License-Identifier: MPL-2.0
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef BMP_HPP
#define BMP_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "pixel_buffer.hpp"

#pragma pack(push, 1)
struct BMPFileHeader
{
    std::uint16_t file_type; // BM
    std::uint32_t file_size;
    std::uint16_t placeholder_1;
    std::uint16_t placeholder_2;
    std::uint32_t offset_data; // this is the start position of pixel data (bytes)
};

struct BMPInfoHeader
{
    std::uint32_t size;  // Size of the header (bytes)
    std::int32_t width;  // in pixels
    std::int32_t height; // in pixels
    std::uint16_t planes;
    std::uint16_t bit_count; // useful to check if file is RGBA or RGB
    std::uint32_t compression;
    std::uint32_t size_image;
    std::int32_t x_per_meter;
    std::int32_t y_per_meter;
    std::uint32_t colours_used;
    std::uint32_t colours_important;
};
#pragma pack(pop)

// BI_RGB, the fourth byte of each pixel is unused
constexpr std::uint32_t bmp_compression_rgb = 0;

// 32-bit BMP image, pixel data is kept as stored on disk (BGRA, bottom row first)
class BMP
{
public:
    BMP(const char *filename);
    BMP(int width, int height);
    BMP(const PixelBuffer &pixels);

    void read(const char *filename);
    void write(const char *filename) const;

    // RGBA copy of the image with the top row first
    PixelBuffer to_pixel_buffer() const;

    int get_width() const { return m_info_header.width; }
    int get_height() const { return m_info_header.height; }

private:
    void init_headers(int width, int height);

    BMPFileHeader m_file_header{};
    BMPInfoHeader m_info_header{};

    std::vector<std::uint8_t> m_data;
};
#endif
