#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "text/text_layer.hpp"

namespace captionist {

class Sequence;

using ContentByLayer = std::unordered_map<std::string, std::string>;

// Insertion-ordered text layers plus the caption each one renders. Never empty.
// Pointers returned by layer() are invalidated by add_layer() and remove_layer().
class LayerSet {
public:
    LayerSet();

    std::string add_layer();
    // Rejects unknown ids and the last remaining layer.
    bool remove_layer(const std::string& id);

    bool contains(const std::string& id) const;
    TextLayer* layer(const std::string& id);
    const TextLayer* layer(const std::string& id) const;
    TextLayer& front() { return layers_.front(); }
    const TextLayer& front() const { return layers_.front(); }

    std::vector<std::string> ids() const;
    std::size_t size() const { return layers_.size(); }
    const std::vector<TextLayer>& layers() const { return layers_; }

    std::optional<std::string> content(const std::string& id) const;
    bool set_content(const std::string& id, const std::string& text);
    const ContentByLayer& contents() const { return contents_; }

    bool render_all(Sequence& sequence, const ContentByLayer& content_by_layer, const TextService& service) const;
    bool render_all(Sequence& sequence, const TextService& service) const { return render_all(sequence, contents_, service); }

    // Renders frames in spiral order around active_index; on_active_rendered fires once,
    // right after the active frame is composited.
    bool render_active_first(Sequence& sequence,
                             const ContentByLayer& content_by_layer,
                             int active_index,
                             const TextService& service,
                             const std::function<void(int)>& on_active_rendered = {}) const;

    // Layer ids on top of point at frame_index, topmost (last drawn) first.
    std::vector<std::string> layers_at(SDL_Point point, int frame_index, const TextService& service) const;

    nlohmann::json to_json() const;
    // Throws std::runtime_error on an empty list, a malformed record or a duplicate id.
    static LayerSet from_json(const nlohmann::json& value);

private:
    explicit LayerSet(std::vector<TextLayer> layers);

    bool render_frame(Sequence& sequence, int index, const ContentByLayer& content_by_layer, const TextService& service) const;

    std::vector<TextLayer> layers_;
    ContentByLayer contents_;
};

}
