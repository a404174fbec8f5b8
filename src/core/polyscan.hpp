// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef polyscan_hpp
#define polyscan_hpp

#include "analysis_components.hpp"

namespace polyscan {

void run_polyscan(const AnalysisComponents& components);

}

#endif
