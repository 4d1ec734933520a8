#include "keyframes/keyframe_store.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace captionist {

namespace {

struct Sample {
    int index;
    int value;
};

int resolve_field(const std::vector<Sample>& samples, int frame_index, int fallback) {
    if (samples.empty()) {
        return fallback;
    }
    if (frame_index <= samples.front().index) {
        return samples.front().value;
    }
    if (frame_index >= samples.back().index) {
        return samples.back().value;
    }
    auto upper = std::lower_bound(samples.begin(), samples.end(), frame_index,
                                  [](const Sample& s, int index) { return s.index < index; });
    if (upper->index == frame_index) {
        return upper->value;
    }
    auto lower = std::prev(upper);
    const double t = static_cast<double>(frame_index - lower->index) /
                     static_cast<double>(upper->index - lower->index);
    const double value = lower->value + (upper->value - lower->value) * t;
    return static_cast<int>(std::lround(value));
}

template <typename Project>
std::vector<Sample> gather(const std::vector<Keyframe>& keyframes, Project project) {
    std::vector<Sample> samples;
    samples.reserve(keyframes.size());
    for (const Keyframe& kf : keyframes) {
        if (auto value = project(kf)) {
            samples.push_back(Sample{kf.frame_index, *value});
        }
    }
    return samples;
}

[[noreturn]] void malformed(std::size_t index, const std::string& why) {
    std::ostringstream oss;
    oss << "Keyframe record " << index << " is malformed: " << why;
    throw std::runtime_error(oss.str());
}

const nlohmann::json* find_either(const nlohmann::json& record, const char* key, const char* legacy_key) {
    auto it = record.find(key);
    if (it != record.end()) {
        return &*it;
    }
    it = record.find(legacy_key);
    if (it != record.end()) {
        return &*it;
    }
    return nullptr;
}

}

std::vector<Keyframe>::iterator KeyframeStore::lower_bound(int frame_index) {
    return std::lower_bound(keyframes_.begin(), keyframes_.end(), frame_index,
                            [](const Keyframe& kf, int index) { return kf.frame_index < index; });
}

std::vector<Keyframe>::const_iterator KeyframeStore::lower_bound(int frame_index) const {
    return std::lower_bound(keyframes_.begin(), keyframes_.end(), frame_index,
                            [](const Keyframe& kf, int index) { return kf.frame_index < index; });
}

void KeyframeStore::insert_or_merge(const Keyframe& keyframe) {
    auto it = lower_bound(keyframe.frame_index);
    if (it != keyframes_.end() && it->frame_index == keyframe.frame_index) {
        if (keyframe.position) {
            it->position = keyframe.position;
        }
        if (keyframe.size) {
            it->size = keyframe.size;
        }
        return;
    }
    keyframes_.insert(it, keyframe);
}

void KeyframeStore::remove(int frame_index) {
    auto it = lower_bound(frame_index);
    if (it != keyframes_.end() && it->frame_index == frame_index) {
        keyframes_.erase(it);
    }
}

std::optional<Keyframe> KeyframeStore::get(int frame_index) const {
    auto it = lower_bound(frame_index);
    if (it != keyframes_.end() && it->frame_index == frame_index) {
        return *it;
    }
    return std::nullopt;
}

bool KeyframeStore::contains(int frame_index) const {
    auto it = lower_bound(frame_index);
    return it != keyframes_.end() && it->frame_index == frame_index;
}

std::vector<int> KeyframeStore::frame_indices() const {
    std::vector<int> indices;
    indices.reserve(keyframes_.size());
    for (const Keyframe& kf : keyframes_) {
        indices.push_back(kf.frame_index);
    }
    return indices;
}

ResolvedKeyframe KeyframeStore::interpolate(int frame_index) const {
    const auto xs = gather(keyframes_, [](const Keyframe& kf) -> std::optional<int> {
        return kf.position ? std::optional<int>(kf.position->x) : std::nullopt;
    });
    const auto ys = gather(keyframes_, [](const Keyframe& kf) -> std::optional<int> {
        return kf.position ? std::optional<int>(kf.position->y) : std::nullopt;
    });
    const auto sizes = gather(keyframes_, [](const Keyframe& kf) { return kf.size; });

    ResolvedKeyframe resolved;
    resolved.position.x = resolve_field(xs, frame_index, kDefaultPosition.x);
    resolved.position.y = resolve_field(ys, frame_index, kDefaultPosition.y);
    resolved.size = resolve_field(sizes, frame_index, kDefaultSize);
    return resolved;
}

Keyframe KeyframeStore::interpolate_keyframe(int frame_index) const {
    const ResolvedKeyframe resolved = interpolate(frame_index);
    Keyframe kf;
    kf.frame_index = frame_index;
    kf.position = resolved.position;
    kf.size = resolved.size;
    return kf;
}

nlohmann::json KeyframeStore::to_json() const {
    nlohmann::json out = nlohmann::json::array();
    for (const Keyframe& kf : keyframes_) {
        nlohmann::json record = nlohmann::json::object();
        record["frame_index"] = kf.frame_index;
        if (kf.position) {
            record["position"] = nlohmann::json::array({kf.position->x, kf.position->y});
        } else {
            record["position"] = nullptr;
        }
        if (kf.size) {
            record["size"] = *kf.size;
        } else {
            record["size"] = nullptr;
        }
        out.push_back(std::move(record));
    }
    return out;
}

KeyframeStore KeyframeStore::from_json(const nlohmann::json& value) {
    if (!value.is_array()) {
        throw std::runtime_error("Keyframes must be a JSON array");
    }
    KeyframeStore store;
    for (std::size_t i = 0; i < value.size(); ++i) {
        const nlohmann::json& record = value[i];
        if (!record.is_object()) {
            malformed(i, "expected an object");
        }
        const nlohmann::json* index = find_either(record, "frame_index", "frame_ind");
        if (!index || !index->is_number_integer()) {
            malformed(i, "missing integer frame_index");
        }
        Keyframe kf;
        kf.frame_index = index->get<int>();

        auto pos = record.find("position");
        if (pos != record.end() && !pos->is_null()) {
            if (!pos->is_array() || pos->size() != 2 || !(*pos)[0].is_number() || !(*pos)[1].is_number()) {
                malformed(i, "position must be [x, y]");
            }
            kf.position = SDL_Point{static_cast<int>(std::lround((*pos)[0].get<double>())),
                                    static_cast<int>(std::lround((*pos)[1].get<double>()))};
        }

        const nlohmann::json* size = find_either(record, "size", "text_size");
        if (size && !size->is_null()) {
            if (!size->is_number()) {
                malformed(i, "size must be a number");
            }
            kf.size = static_cast<int>(std::lround(size->get<double>()));
        }
        store.insert_or_merge(kf);
    }
    return store;
}

}
