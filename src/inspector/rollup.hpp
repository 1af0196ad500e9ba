#pragma once

#include <string>

#include "inspector.hpp"

// For every directory from a hit's parent up to root, keep the newest stamp
// of anything below it. Following the max down from root leads to the most
// recent change.
Hits rollup(const Hits& hits, const std::string& root);
