#include <catch2/catch_all.hpp>
#include "../src/errors.hpp"
#include "../src/pixel_buffer.hpp"

#include <stdexcept>
#include <vector>

using Catch::Matchers::ContainsSubstring;

TEST_CASE("Creating pixel buffers", "[pixel_buffer]") {
    SECTION("A new buffer is fully transparent") {
        PixelBuffer buffer(3, 2);

        REQUIRE(buffer.get_width() == 3);
        REQUIRE(buffer.get_height() == 2);
        REQUIRE(buffer.get_pixel_count() == 6);
        REQUIRE(buffer.get_data() == std::vector<std::uint8_t>(3 * 2 * pixel_stride, 0));
    }

    SECTION("Wraps existing data in row-major order") {
        std::vector<std::uint8_t> data = {
            1, 2, 3, 4, 5, 6, 7, 8,
            9, 10, 11, 12, 13, 14, 15, 16};
        PixelBuffer buffer(2, 2, data);

        REQUIRE(buffer.get_pixel(1, 0) == PixelValues{5, 6, 7, 8});
        REQUIRE(buffer.get_pixel(0, 1) == PixelValues{9, 10, 11, 12});
    }

    SECTION("Throws when the data does not match the dimensions") {
        std::vector<std::uint8_t> data(2 * 2 * pixel_stride + 1, 0);

        REQUIRE_THROWS_AS(PixelBuffer(2, 2, data), DimensionMismatch);
        REQUIRE_THROWS_WITH(PixelBuffer(2, 2, data), ContainsSubstring("does not match"));
    }

    SECTION("Throws for negative dimensions") {
        REQUIRE_THROWS_AS(PixelBuffer(-1, 2), DimensionMismatch);
    }

    SECTION("Fills every pixel with a colour") {
        PixelBuffer buffer(4, 4, PixelValues{1, 2, 3, 4});

        REQUIRE(buffer.get_pixel(0, 0) == PixelValues{1, 2, 3, 4});
        REQUIRE(buffer.get_pixel(3, 3) == PixelValues{1, 2, 3, 4});
    }
}

TEST_CASE("Addressing pixels", "[pixel_buffer]") {
    PixelBuffer buffer(4, 3);

    SECTION("Indexes are byte offsets of row-major pixels") {
        REQUIRE(buffer.index(0, 0) == 0);
        REQUIRE(buffer.index(1, 0) == 4);
        REQUIRE(buffer.index(0, 1) == 16);
        REQUIRE(buffer.index(3, 2) == 44);
    }

    SECTION("Throws for pixels outside the buffer") {
        REQUIRE_THROWS_AS(buffer.index(4, 0), std::out_of_range);
        REQUIRE_THROWS_AS(buffer.index(0, 3), std::out_of_range);
        REQUIRE_THROWS_AS(buffer.index(-1, 0), std::out_of_range);
        REQUIRE_THROWS_AS(buffer.get_pixel(0, -1), std::out_of_range);
        REQUIRE_FALSE(buffer.contains(4, 2));
        REQUIRE(buffer.contains(3, 2));
    }

    SECTION("Sets a single pixel") {
        buffer.set_pixel(2, 1, {9, 8, 7, 6});

        REQUIRE(buffer.get_pixel(2, 1) == PixelValues{9, 8, 7, 6});
        REQUIRE(buffer.get_pixel(1, 2) == PixelValues{0, 0, 0, 0});
    }

    SECTION("Compares sizes") {
        REQUIRE(buffer.same_size(PixelBuffer(4, 3)));
        REQUIRE_FALSE(buffer.same_size(PixelBuffer(3, 4)));
    }
}
