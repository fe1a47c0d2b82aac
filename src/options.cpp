//
//
// Copyright the mso-test contributors
//
// SPDX-License-Identifier: MPL-2.0
//
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <string>

#include "errors.hpp"
#include "options.hpp"

static void check_unit_range(float value, const std::string &name)
{
    // written so that NaN fails as well
    if (!(value >= 0.0f && value <= 1.0f))
    {
        throw InvalidOption("The " + name + " must be between 0 and 1, got " + std::to_string(value));
    }
}

void Options::validate() const
{
    check_unit_range(threshold, "threshold");
    check_unit_range(alpha, "alpha");
}
