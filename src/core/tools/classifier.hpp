// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef classifier_hpp
#define classifier_hpp

namespace polyscan { namespace coretools {

constexpr double DefaultDivergenceThreshold {90.0};

// true if the similarity percentage is below threshold, i.e. the query has diverged from the reference.
bool classify(double similarity, double threshold = DefaultDivergenceThreshold) noexcept;

} // namespace coretools
} // namespace polyscan

#endif
