//
//
// Copyright the mso-test contributors
//
// SPDX-License-Identifier: MPL-2.0
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>

// Thrown when images, or an image and its pixel data, disagree in size
class DimensionMismatch : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Thrown when a comparison option is out of its allowed range
class InvalidOption : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
#endif
