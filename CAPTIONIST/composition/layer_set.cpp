#include "layer_set.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "composition/spiral_order.hpp"
#include "sequence/sequence.hpp"
#include "utils/log.hpp"

namespace captionist {

namespace {
constexpr const char* kLayerIdPrefix = "Text ";
}

LayerSet::LayerSet() {
    add_layer();
}

LayerSet::LayerSet(std::vector<TextLayer> layers)
: layers_(std::move(layers)) {
    for (const TextLayer& layer : layers_) {
        contents_[layer.id()] = layer.id();
    }
}

std::string LayerSet::add_layer() {
    std::size_t number = layers_.size() + 1;
    std::string id = kLayerIdPrefix + std::to_string(number);
    while (contains(id)) {
        id = kLayerIdPrefix + std::to_string(++number);
    }
    layers_.emplace_back(id);
    contents_[id] = id;
    log::debug("[LayerSet] Added layer '" + id + "'");
    return id;
}

bool LayerSet::remove_layer(const std::string& id) {
    auto it = std::find_if(layers_.begin(), layers_.end(),
                           [&](const TextLayer& layer) { return layer.id() == id; });
    if (it == layers_.end()) {
        return false;
    }
    if (layers_.size() == 1) {
        log::warn("[LayerSet] Refusing to remove the last layer '" + id + "'");
        return false;
    }
    layers_.erase(it);
    contents_.erase(id);
    return true;
}

bool LayerSet::contains(const std::string& id) const {
    return layer(id) != nullptr;
}

TextLayer* LayerSet::layer(const std::string& id) {
    for (TextLayer& layer : layers_) {
        if (layer.id() == id) {
            return &layer;
        }
    }
    return nullptr;
}

const TextLayer* LayerSet::layer(const std::string& id) const {
    for (const TextLayer& layer : layers_) {
        if (layer.id() == id) {
            return &layer;
        }
    }
    return nullptr;
}

std::vector<std::string> LayerSet::ids() const {
    std::vector<std::string> out;
    out.reserve(layers_.size());
    for (const TextLayer& layer : layers_) {
        out.push_back(layer.id());
    }
    return out;
}

std::optional<std::string> LayerSet::content(const std::string& id) const {
    auto it = contents_.find(id);
    if (it == contents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LayerSet::set_content(const std::string& id, const std::string& text) {
    if (!contains(id)) {
        return false;
    }
    contents_[id] = text;
    return true;
}

bool LayerSet::render_frame(Sequence& sequence, int index, const ContentByLayer& content_by_layer, const TextService& service) const {
    Frame& frame = sequence.at(index);
    bool all_drawn = true;
    for (const TextLayer& layer : layers_) {
        auto it = content_by_layer.find(layer.id());
        if (it == content_by_layer.end() || it->second.empty()) {
            continue;
        }
        if (!layer.draw(frame, index, it->second, service)) {
            all_drawn = false;
        }
    }
    return all_drawn;
}

bool LayerSet::render_all(Sequence& sequence, const ContentByLayer& content_by_layer, const TextService& service) const {
    bool all_drawn = true;
    for (int i = 0; i < sequence.length(); ++i) {
        if (!render_frame(sequence, i, content_by_layer, service)) {
            all_drawn = false;
        }
    }
    return all_drawn;
}

bool LayerSet::render_active_first(Sequence& sequence,
                                   const ContentByLayer& content_by_layer,
                                   int active_index,
                                   const TextService& service,
                                   const std::function<void(int)>& on_active_rendered) const {
    const std::vector<int> order = spiral_order(active_index, sequence.length());
    bool all_drawn = true;
    for (std::size_t i = 0; i < order.size(); ++i) {
        if (!render_frame(sequence, order[i], content_by_layer, service)) {
            all_drawn = false;
        }
        if (i == 0 && on_active_rendered) {
            on_active_rendered(order[i]);
        }
    }
    return all_drawn;
}

std::vector<std::string> LayerSet::layers_at(SDL_Point point, int frame_index, const TextService& service) const {
    std::vector<std::string> hits;
    for (auto it = layers_.rbegin(); it != layers_.rend(); ++it) {
        auto content_it = contents_.find(it->id());
        const std::string& text = content_it != contents_.end() ? content_it->second : it->id();
        if (it->contains_point(point, frame_index, text, service)) {
            hits.push_back(it->id());
        }
    }
    return hits;
}

nlohmann::json LayerSet::to_json() const {
    nlohmann::json out = nlohmann::json::array();
    for (const TextLayer& layer : layers_) {
        out.push_back(layer.to_json());
    }
    return out;
}

LayerSet LayerSet::from_json(const nlohmann::json& value) {
    if (!value.is_array()) {
        throw std::runtime_error("Layer document must be a JSON array");
    }
    if (value.empty()) {
        throw std::runtime_error("Layer document must contain at least one layer");
    }
    std::vector<TextLayer> layers;
    std::unordered_set<std::string> seen;
    layers.reserve(value.size());
    for (const nlohmann::json& record : value) {
        TextLayer layer = TextLayer::from_json(record);
        if (!seen.insert(layer.id()).second) {
            throw std::runtime_error("Layer document repeats the id '" + layer.id() + "'");
        }
        layers.push_back(std::move(layer));
    }
    return LayerSet(std::move(layers));
}

}
