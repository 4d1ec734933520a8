#include "spiral_order.hpp"

#include <algorithm>

namespace captionist {

std::vector<int> spiral_order(int active, int length) {
    std::vector<int> order;
    if (length <= 0) {
        return order;
    }
    active = std::clamp(active, 0, length - 1);
    order.reserve(static_cast<std::size_t>(length));
    order.push_back(active);

    int forward = active + 1;
    int backward = active - 1;
    while (forward < length || backward >= 0) {
        if (forward < length) {
            order.push_back(forward++);
        }
        if (backward >= 0) {
            order.push_back(backward--);
        }
    }
    return order;
}

}
