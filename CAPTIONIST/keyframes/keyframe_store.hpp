#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "keyframes/keyframe.hpp"

namespace captionist {

// Sparse keyframes kept unique by frame index in ascending order.
class KeyframeStore {
public:
    using const_iterator = std::vector<Keyframe>::const_iterator;

    // An existing keyframe at the same index absorbs the fields present in keyframe.
    void insert_or_merge(const Keyframe& keyframe);
    void remove(int frame_index);
    void reset() { keyframes_.clear(); }

    std::optional<Keyframe> get(int frame_index) const;
    bool contains(int frame_index) const;
    std::vector<int> frame_indices() const;

    std::size_t size() const { return keyframes_.size(); }
    bool empty() const { return keyframes_.empty(); }
    const_iterator begin() const { return keyframes_.begin(); }
    const_iterator end() const { return keyframes_.end(); }

    // Each field resolves independently: defaults when no keyframe defines it, flat
    // outside the defined range, linear (rounded to nearest) between neighbours.
    ResolvedKeyframe interpolate(int frame_index) const;
    Keyframe interpolate_keyframe(int frame_index) const;

    nlohmann::json to_json() const;
    // Throws std::runtime_error when the value is not a list of keyframe records.
    static KeyframeStore from_json(const nlohmann::json& value);

    bool operator==(const KeyframeStore& other) const { return keyframes_ == other.keyframes_; }
    bool operator!=(const KeyframeStore& other) const { return !(*this == other); }

private:
    std::vector<Keyframe>::iterator lower_bound(int frame_index);
    std::vector<Keyframe>::const_iterator lower_bound(int frame_index) const;

    std::vector<Keyframe> keyframes_;
};

}
