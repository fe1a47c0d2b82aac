#include <catch2/catch_all.hpp>
#include "../src/bmp.hpp"
#include "../src/pixel.hpp"
#include "../src/pixelmatcher.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using Catch::Matchers::ContainsSubstring;

static std::string output_path(const std::string &filename)
{
    std::filesystem::path directory = std::filesystem::temp_directory_path() / "pixelmatch_test";
    std::filesystem::create_directories(directory);
    return (directory / filename).string();
}

TEST_CASE("Read BMP files" , "[bmp][read]") {
    SECTION("Throws an error when the file does not exist") {
        std::string bmp_path = output_path("missing.bmp");
        std::filesystem::remove(bmp_path);

        REQUIRE_THROWS_WITH(BMP(bmp_path.c_str()), ContainsSubstring("Can't open"));
    }

    SECTION("Throws an error when reading non-BMP file") {
        std::string bmp_path = output_path("not_bmp.png");
        std::ofstream file(bmp_path, std::ios_base::binary);
        file << "\x89PNG\r\n\x1a\n plus enough bytes to fill the headers of a bitmap file";
        file.close();

        BMP not_bmp(1, 1);
        REQUIRE_THROWS_WITH(not_bmp.read(bmp_path.c_str()), ContainsSubstring("Not a BMP"));
    }

    SECTION("Throws an error when reading 24-bit BMP") {
        std::string bmp_path = output_path("24_bit.bmp");
        BMPFileHeader file_header{0x4D42, 0, 0, 0, sizeof(BMPFileHeader) + sizeof(BMPInfoHeader)};
        BMPInfoHeader info_header{sizeof(BMPInfoHeader), 2, 2, 1, 24, 0, 0, 0, 0, 0, 0};
        std::ofstream file(bmp_path, std::ios_base::binary);
        file.write(reinterpret_cast<const char *>(&file_header), sizeof(file_header));
        file.write(reinterpret_cast<const char *>(&info_header), sizeof(info_header));
        file.close();

        BMP bad_image(1, 1);
        REQUIRE_THROWS_WITH(bad_image.read(bmp_path.c_str()), ContainsSubstring("32 bits") && ContainsSubstring("RGBA"));
    }

    SECTION("Throws an error when the pixel data is cut short") {
        std::string bmp_path = output_path("truncated.bmp");
        BMP(10, 10).write(bmp_path.c_str());
        std::filesystem::resize_file(bmp_path, std::filesystem::file_size(bmp_path) - 40);

        REQUIRE_THROWS_WITH(BMP(bmp_path.c_str()), ContainsSubstring("truncated"));
    }
}

TEST_CASE("Writing BMP files", "[bmp][write]") {
    std::string bmp_path = output_path("100x100.bmp");
    BMP dummy_image(100, 100);

    SECTION("Create and writes a 100x100 BMP successfully") {
        REQUIRE_NOTHROW(dummy_image.write(bmp_path.c_str()));
    }

    SECTION("Writes and re-reads 100x100 BMP with matching data") {
        dummy_image.write(bmp_path.c_str());

        BMP dummy_image_input(bmp_path.c_str());
        REQUIRE(dummy_image_input.get_width() == dummy_image.get_width());
        REQUIRE(dummy_image_input.get_height() == dummy_image.get_height());
        REQUIRE(dummy_image_input.to_pixel_buffer() == dummy_image.to_pixel_buffer());
    }

    SECTION("Throws an error when the output cannot be created") {
        std::string bad_path = output_path("no_such_directory/out.bmp");
        REQUIRE_THROWS_WITH(dummy_image.write(bad_path.c_str()), ContainsSubstring("Cannot open/create"));
    }

    SECTION("Throws an error for non-positive sizes") {
        REQUIRE_THROWS_WITH(BMP(0, 10), ContainsSubstring("must positive"));
    }
}

TEST_CASE("Converting BMP files to pixel buffers", "[bmp][pixels]") {
    PixelBuffer pixels(3, 2, colour_to_pixel[WHITE]);
    pixels.set_pixel(0, 0, {255, 0, 0, 255});
    pixels.set_pixel(2, 1, {10, 20, 30, 128});

    SECTION("Stores the top row last and channels as BGRA") {
        std::string bmp_path = output_path("3x2_layout.bmp");
        BMP(pixels).write(bmp_path.c_str());

        std::ifstream file(bmp_path, std::ios_base::binary);
        BMPFileHeader file_header{};
        file.read(reinterpret_cast<char *>(&file_header), sizeof(file_header));
        std::vector<std::uint8_t> data(3 * 2 * pixel_stride);
        file.seekg(file_header.offset_data, file.beg);
        file.read(reinterpret_cast<char *>(data.data()), data.size());
        REQUIRE(file);

        // (0, 0) is the first pixel of the last stored row
        std::size_t top_left = 1 * 3 * pixel_stride;
        REQUIRE(data[top_left + 0] == 0);
        REQUIRE(data[top_left + 1] == 0);
        REQUIRE(data[top_left + 2] == 255);
        REQUIRE(data[top_left + 3] == 255);

        // (2, 1) is the last pixel of the first stored row
        REQUIRE(data[2 * pixel_stride + 0] == 30);
        REQUIRE(data[2 * pixel_stride + 2] == 10);
        REQUIRE(data[2 * pixel_stride + 3] == 128);
    }

    SECTION("Round trips through a file without changing any pixel") {
        std::string bmp_path = output_path("3x2.bmp");
        BMP(pixels).write(bmp_path.c_str());

        PixelBuffer read_back = BMP(bmp_path.c_str()).to_pixel_buffer();
        REQUIRE(read_back == pixels);
    }

    SECTION("Images with an odd width round trip") {
        PixelBuffer odd(5, 3, colour_to_pixel[BLACK]);
        odd.set_pixel(4, 0, colour_to_pixel[YELLOW]);
        std::string bmp_path = output_path("5x3.bmp");
        BMP(odd).write(bmp_path.c_str());

        REQUIRE(BMP(bmp_path.c_str()).to_pixel_buffer() == odd);
    }
}

TEST_CASE("Reading BI_RGB BMP files", "[bmp][read][bi_rgb]") {
    // 32-bit BI_RGB files leave the fourth byte of each pixel as zero
    auto write_bi_rgb = [](const std::string &bmp_path, std::uint8_t value) {
        std::uint32_t offset = sizeof(BMPFileHeader) + sizeof(BMPInfoHeader);
        std::uint32_t data_size = 4 * 4 * pixel_stride;
        BMPFileHeader file_header{0x4D42, offset + data_size, 0, 0, offset};
        BMPInfoHeader info_header{sizeof(BMPInfoHeader), 4, 4, 1, 32, bmp_compression_rgb, data_size, 0, 0, 0, 0};
        std::vector<std::uint8_t> data(data_size, value);
        for (std::size_t i = 3; i < data.size(); i += pixel_stride)
        {
            data[i] = 0;
        }

        std::ofstream file(bmp_path, std::ios_base::binary);
        file.write(reinterpret_cast<const char *>(&file_header), sizeof(file_header));
        file.write(reinterpret_cast<const char *>(&info_header), sizeof(info_header));
        file.write(reinterpret_cast<const char *>(data.data()), data.size());
    };

    std::string black_path = output_path("bi_rgb_black.bmp");
    std::string white_path = output_path("bi_rgb_white.bmp");
    write_bi_rgb(black_path, 0);
    write_bi_rgb(white_path, 255);

    PixelBuffer black = BMP(black_path.c_str()).to_pixel_buffer();
    PixelBuffer white = BMP(white_path.c_str()).to_pixel_buffer();

    SECTION("Pixels are read as fully opaque") {
        REQUIRE(black == PixelBuffer(4, 4, colour_to_pixel[BLACK]));
        REQUIRE(white == PixelBuffer(4, 4, colour_to_pixel[WHITE]));
    }

    SECTION("Black and white images differ on every pixel") {
        DiffResult result = PixelMatcher::compare(black, white, nullptr);
        REQUIRE(result.differing_pixels == 16);
    }
}
