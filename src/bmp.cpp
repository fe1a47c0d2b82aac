//
//
// Copyright the mso-test contributors
//
// SPDX-License-Identifier: MPL-2.0
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <bit>
#include <fstream>
#include <stdexcept>
#include <string>

#include "bmp.hpp"

struct BMPColourHeader
{
    std::uint32_t red_mask;
    std::uint32_t green_mask;
    std::uint32_t blue_mask;
    std::uint32_t alpha_mask;
    std::uint32_t colour_space;
    std::uint32_t unused[16];
};

const static BMPColourHeader colour_header = {
    0x00ff0000,
    0x0000ff00,
    0x000000ff,
    0xff000000,
    0x73524742,
    {}};

BMP::BMP(const char *filename)
{
    read(filename);
}

BMP::BMP(int width, int height)
{
    if (width <= 0 || height <= 0)
    {
        throw std::runtime_error("The image width and height values must positive");
    }
    init_headers(width, height);
}

BMP::BMP(const PixelBuffer &pixels)
    : BMP(pixels.get_width(), pixels.get_height())
{
    int width = pixels.get_width();
    int height = pixels.get_height();
    std::size_t row_stride = static_cast<std::size_t>(width) * pixel_stride;

    // BMP rows go bottom to top, and channels are stored as BGRA
    for (int y = 0; y < height; y++)
    {
        std::uint8_t *dest_row = &m_data[(height - 1 - y) * row_stride];
        for (int x = 0; x < width; x++)
        {
            PixelValues rgba = pixels.get_pixel(x, y);
            dest_row[x * pixel_stride + 0] = rgba[2];
            dest_row[x * pixel_stride + 1] = rgba[1];
            dest_row[x * pixel_stride + 2] = rgba[0];
            dest_row[x * pixel_stride + 3] = rgba[3];
        }
    }
}

void BMP::init_headers(int width, int height)
{
    // Setup correct values for info header and file header
    m_file_header.file_type = 0x4D42;
    m_info_header.planes = 1;
    m_info_header.width = width;
    m_info_header.height = height;

    m_info_header.size = sizeof(BMPInfoHeader) + sizeof(BMPColourHeader);
    m_file_header.offset_data = sizeof(BMPFileHeader) + sizeof(BMPInfoHeader) + sizeof(BMPColourHeader);

    m_info_header.bit_count = 32;
    m_info_header.compression = 3;
    std::size_t row_stride = static_cast<std::size_t>(width) * pixel_stride;
    m_data.assign(row_stride * height, 0);
    m_info_header.size_image = m_data.size();
    m_file_header.file_size = m_file_header.offset_data + m_data.size();
}

void BMP::read(const char *filename)
{
    static_assert(std::endian::native == std::endian::little, "This code only works for little endian");
    std::ifstream input{filename, std::ios_base::binary};
    if (!input)
    {
        throw std::runtime_error(std::string("Can't open the BMP file: ") + filename);
    }

    input.read(reinterpret_cast<char *>(&m_file_header), sizeof(m_file_header)); // read file header data into struct
    if (!input)
    {
        throw std::runtime_error(std::string("Error: reading file header has led to bad input state"));
    }
    if (m_file_header.file_type != 0x4D42)
    {
        throw std::runtime_error("Not a BMP file, file header type has to be 'BM'");
    }

    input.read(reinterpret_cast<char *>(&m_info_header), sizeof(m_info_header)); // read info header data into struct
    if (!input)
    {
        throw std::runtime_error(std::string("Error: reading info header has led to bad input state"));
    }
    if (m_info_header.bit_count != 32)
    {
        throw std::runtime_error("Needs to be in RGBA format (32 bits), nothing else");
    }
    if (m_info_header.height < 0)
    {
        throw std::runtime_error("The program can treat only BMP images with the origin in the bottom left corner!");
    }
    if (m_info_header.width <= 0 || m_info_header.height == 0)
    {
        throw std::runtime_error("Invalid BMP size: " + std::to_string(m_info_header.width) + "x" +
                                 std::to_string(m_info_header.height));
    }

    input.seekg(m_file_header.offset_data, input.beg);

    std::size_t row_stride = static_cast<std::size_t>(m_info_header.width) * m_info_header.bit_count / 8;
    std::size_t alligned_stride = (row_stride + 3) & ~static_cast<std::size_t>(3); // This rounds up to the nearest multiple of 4
    std::size_t padding_size = alligned_stride - row_stride;

    m_data.resize(row_stride * m_info_header.height);

    // read the pixel data row by row, and handle the padding if its necessary
    for (int y = 0; y < m_info_header.height; y++)
    {
        input.read(reinterpret_cast<char *>(m_data.data() + y * row_stride), row_stride);
        input.seekg(padding_size, input.cur);
    }
    if (!input)
    {
        throw std::runtime_error(std::string("Pixel data is truncated in BMP file: ") + filename);
    }
}

void BMP::write(const char *filename) const
{
    std::ofstream output{filename, std::ios_base::binary};
    if (!output)
    {
        throw std::runtime_error(std::string("Cannot open/create the file to write: ") + filename);
    }

    // write the headers
    output.write(reinterpret_cast<const char *>(&m_file_header), sizeof(m_file_header));
    output.write(reinterpret_cast<const char *>(&m_info_header), sizeof(m_info_header));
    output.write(reinterpret_cast<const char *>(&colour_header), sizeof(colour_header));

    std::size_t row_stride = static_cast<std::size_t>(m_info_header.width) * m_info_header.bit_count / 8;
    std::size_t alligned_stride = (row_stride + 3) & ~static_cast<std::size_t>(3);
    std::size_t padding_size = alligned_stride - row_stride;

    std::vector<std::uint8_t> padding(padding_size, 0);

    // write the pixel data row by row
    for (int y = 0; y < m_info_header.height; y++)
    {
        output.write(reinterpret_cast<const char *>(m_data.data() + y * row_stride), row_stride);
        if (padding_size > 0)
        {
            output.write(reinterpret_cast<const char *>(padding.data()), padding_size);
        }
    }
    if (!output)
    {
        throw std::runtime_error(std::string("Failed while writing BMP file: ") + filename);
    }
}

PixelBuffer BMP::to_pixel_buffer() const
{
    int width = get_width();
    int height = get_height();
    std::size_t row_stride = static_cast<std::size_t>(width) * pixel_stride;
    PixelBuffer pixels(width, height);
    bool has_alpha = m_info_header.compression != bmp_compression_rgb;

    for (int y = 0; y < height; y++)
    {
        const std::uint8_t *src_row = &m_data[(height - 1 - y) * row_stride];
        for (int x = 0; x < width; x++)
        {
            const std::uint8_t *bgra = &src_row[x * pixel_stride];
            std::uint8_t alpha = has_alpha ? bgra[3] : 255;
            pixels.set_pixel(x, y, {bgra[2], bgra[1], bgra[0], alpha});
        }
    }
    return pixels;
}
