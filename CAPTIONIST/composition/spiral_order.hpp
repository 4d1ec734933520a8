#pragma once

#include <vector>

namespace captionist {

// Visits active first, then alternates one step forward and one step backward,
// draining whichever side remains. active is clamped into [0, length).
std::vector<int> spiral_order(int active, int length);

}
