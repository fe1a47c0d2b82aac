//
//
// Copyright the mso-test contributors
//
// SPDX-License-Identifier: MPL-2.0
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "bmp.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "pixelmatcher.hpp"

constexpr int exit_images_match = 0;
constexpr int exit_error = 1;
constexpr int exit_dimension_mismatch = 65;
constexpr int exit_images_differ = 66;

const std::string usage =
    "Usage: pixelmatch expected.bmp actual.bmp [diff.bmp] [--threshold 0.1] [--include-aa] [--alpha 0.1]\n"
    "                  [--aa-colour R,G,B] [--diff-colour R,G,B] [--diff-colour-alt R,G,B] [--diff-mask]\n"
    "                  [--threads N]";

struct ParsedArguments
{
    std::string expected_path;
    std::string actual_path;
    std::string diff_path;
    Options options;
    bool show_help = false;
};

float parse_float(const std::string &value, const std::string &option_name)
{
    std::size_t parsed = 0;
    float result = 0.0f;
    try
    {
        result = std::stof(value, &parsed);
    }
    catch (const std::exception &)
    {
        throw std::runtime_error("Incorrect usage for " + option_name + ": " + value + " is not a number");
    }
    if (parsed != value.size())
    {
        throw std::runtime_error("Incorrect usage for " + option_name + ": " + value + " is not a number");
    }
    return result;
}

unsigned int parse_count(const std::string &value, const std::string &option_name)
{
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 4)
    {
        throw std::runtime_error("Incorrect usage for " + option_name + ": " + value + " should be a whole number");
    }
    return static_cast<unsigned int>(std::stoul(value));
}

// Colours are given as "R,G,B" and are always drawn fully opaque
PixelValues parse_colour(const std::string &value, const std::string &option_name)
{
    std::vector<std::string> parts;
    std::stringstream stream(value);
    std::string part;
    while (std::getline(stream, part, ','))
    {
        parts.push_back(part);
    }

    if (parts.size() != 3)
    {
        throw std::runtime_error("Incorrect usage for " + option_name + ": " + value + " should be R,G,B");
    }

    PixelValues colour = {0, 0, 0, 255};
    for (int i = 0; i < 3; i++)
    {
        unsigned int channel = parse_count(parts[i], option_name);
        if (channel > 255)
        {
            throw std::runtime_error("Incorrect usage for " + option_name + ": " + parts[i] + " is above 255");
        }
        colour[i] = static_cast<std::uint8_t>(channel);
    }
    return colour;
}

std::string next_value(int argc, char *argv[], int &arg_index, const std::string &option_name)
{
    if (arg_index + 1 >= argc)
    {
        throw std::runtime_error("Incorrect usage: " + option_name + " needs a value\n" + usage);
    }
    return argv[++arg_index];
}

ParsedArguments parse_arguments(int argc, char *argv[])
{
    ParsedArguments args;
    std::vector<std::string> paths;

    for (int arg_index = 1; arg_index < argc; arg_index++)
    {
        std::string arg = argv[arg_index];

        if (arg == "-h" || arg == "--help")
        {
            args.show_help = true;
            return args;
        }
        else if (arg == "-t" || arg == "--threshold")
        {
            args.options.threshold = parse_float(next_value(argc, argv, arg_index, arg), arg);
        }
        else if (arg == "-i" || arg == "--include-aa")
        {
            args.options.include_anti_aliasing = true;
        }
        else if (arg == "--alpha")
        {
            args.options.alpha = parse_float(next_value(argc, argv, arg_index, arg), arg);
        }
        else if (arg == "--aa-colour")
        {
            args.options.anti_alias_colour = parse_colour(next_value(argc, argv, arg_index, arg), arg);
        }
        else if (arg == "--diff-colour")
        {
            args.options.diff_colour = parse_colour(next_value(argc, argv, arg_index, arg), arg);
        }
        else if (arg == "--diff-colour-alt")
        {
            args.options.diff_colour_alt = parse_colour(next_value(argc, argv, arg_index, arg), arg);
        }
        else if (arg == "--diff-mask")
        {
            args.options.diff_mask = true;
        }
        else if (arg == "--threads")
        {
            args.options.thread_count = parse_count(next_value(argc, argv, arg_index, arg), arg);
        }
        else if (arg.rfind("-", 0) == 0)
        {
            throw std::runtime_error("Incorrect usage: unknown option " + arg + "\n" + usage);
        }
        else
        {
            paths.push_back(arg);
        }
    }

    if (paths.size() < 2 || paths.size() > 3)
    {
        throw std::runtime_error("Incorrect usage: expected two images and an optional diff output\n" + usage);
    }

    args.expected_path = paths[0];
    args.actual_path = paths[1];
    if (paths.size() == 3)
    {
        args.diff_path = paths[2];
    }
    return args;
}

int main(int argc, char *argv[])
{
    try
    {
        ParsedArguments args = parse_arguments(argc, argv);
        if (args.show_help)
        {
            std::cout << usage << std::endl;
            return exit_images_match;
        }

        PixelBuffer expected = BMP(args.expected_path.c_str()).to_pixel_buffer();
        PixelBuffer actual = BMP(args.actual_path.c_str()).to_pixel_buffer();

        std::optional<PixelBuffer> diff;
        if (!args.diff_path.empty() && expected.same_size(actual))
        {
            diff.emplace(expected.get_width(), expected.get_height());
        }

        auto start = std::chrono::steady_clock::now();
        DiffResult result = PixelMatcher::compare(expected, actual, diff ? &*diff : nullptr, args.options);
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);

        std::cout << "matched in " << elapsed.count() << "us" << std::endl;
        std::cout << "different pixels: " << result.differing_pixels << std::endl;
        std::cout << "error: " << std::fixed << std::setprecision(2) << result.error_percentage() << "%" << std::endl;

        if (diff)
        {
            BMP(*diff).write(args.diff_path.c_str());
        }

        return result.differing_pixels > 0 ? exit_images_differ : exit_images_match;
    }
    catch (const DimensionMismatch &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return exit_dimension_mismatch;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return exit_error;
    }
}
