// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "classifier.hpp"

namespace polyscan { namespace coretools {

bool classify(const double similarity, const double threshold) noexcept
{
    return similarity < threshold;
}

} // namespace coretools
} // namespace polyscan
