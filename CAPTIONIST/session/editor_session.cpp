#include "session/editor_session.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include "persistence/document_store.hpp"
#include "session/status_notifier.hpp"
#include "tracking/opencv_region_tracker.hpp"
#include "utils/color.hpp"
#include "utils/log.hpp"
#include "utils/staged_write.hpp"
#include "utils/string_utils.hpp"

namespace captionist {

namespace {
constexpr const char* kInvalidKeyframeMessage = "Invalid values for keyframe. Please try again.";

bool parse_optional_int(const std::string& text, std::optional<int>& out) {
    if (strings::trim_copy(text).empty()) {
        out.reset();
        return true;
    }
    out = strings::parse_int(text);
    return out.has_value();
}
}

EditorSession::EditorSession(Sequence sequence, const TextService& text_service, RegionTrackerFactory tracker_factory)
: EditorSession(std::move(sequence), LayerSet{}, text_service, std::move(tracker_factory)) {}

EditorSession::EditorSession(Sequence sequence, LayerSet layers, const TextService& text_service,
                             RegionTrackerFactory tracker_factory)
: original_(std::move(sequence)),
  layers_(std::move(layers)),
  text_service_(text_service),
  tracker_(tracker_factory ? std::move(tracker_factory) : OpenCvRegionTracker::factory()),
  selected_id_(layers_.front().id()) {
    render();
}

TextLayer& EditorSession::selected() {
    TextLayer* layer = layers_.layer(selected_id_);
    if (!layer) {
        selected_id_ = layers_.front().id();
        return layers_.front();
    }
    return *layer;
}

const TextLayer& EditorSession::selected_layer() const {
    const TextLayer* layer = layers_.layer(selected_id_);
    return layer ? *layer : layers_.front();
}

void EditorSession::set_status(const std::string& message) {
    status_ = message;
    status::notify(message);
}

bool EditorSession::reject(const std::string& message) {
    set_status(message);
    return false;
}

bool EditorSession::open(const std::filesystem::path& gif_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(gif_path, ec)) {
        return reject("File does not exist: " + gif_path.string());
    }

    std::optional<LayerSet> loaded_layers;
    try {
        Sequence sequence = Sequence::open(gif_path);
        const std::filesystem::path document_path = document_store::document_path_for(gif_path);
        if (auto document = document_store::load_document(document_path)) {
            loaded_layers = LayerSet::from_json(*document);
        }
        original_ = std::move(sequence);
    } catch (const std::exception& ex) {
        log::error(std::string("[EditorSession] open failed: ") + ex.what());
        return reject(std::string("Failed to load ") + gif_path.string() + ": " + ex.what());
    }

    if (loaded_layers) {
        layers_ = std::move(*loaded_layers);
    }
    selected_id_ = layers_.front().id();
    source_path_ = gif_path;
    current_frame_ = 0;
    tracking_mode_ = false;
    tracker_.reset();
    render();
    set_status("Loaded " + gif_path.string());
    return true;
}

void EditorSession::set_frame(int index) {
    const int last = std::max(0, frame_count() - 1);
    current_frame_ = std::clamp(index, 0, last);
}

bool EditorSession::select_layer(const std::string& id) {
    if (!layers_.contains(id)) {
        return false;
    }
    selected_id_ = id;
    return true;
}

FrameProperties EditorSession::frame_properties() const {
    const KeyframeStore& store = selected_layer().keyframes();
    const ResolvedKeyframe resolved = store.interpolate(current_frame_);
    FrameProperties props;
    props.frame_index = current_frame_;
    props.x = resolved.position.x;
    props.y = resolved.position.y;
    props.size = resolved.size;
    props.is_keyframe = store.contains(current_frame_);
    return props;
}

bool EditorSession::apply_frame_properties(const std::string& x_text, const std::string& y_text, const std::string& size_text) {
    KeyframeStore& store = selected().keyframes();
    const std::optional<Keyframe> current = store.get(current_frame_);
    if (!current) {
        return false;
    }

    std::optional<int> x;
    std::optional<int> y;
    std::optional<int> size;
    if (!parse_optional_int(x_text, x) || !parse_optional_int(y_text, y) ||
        !parse_optional_int(size_text, size) || (size && *size <= 0)) {
        return reject(kInvalidKeyframeMessage);
    }

    Keyframe edited;
    edited.frame_index = current_frame_;
    if (x && y) {
        edited.position = SDL_Point{*x, *y};
    }
    edited.size = size;
    if (edited == *current) {
        return true;
    }
    store.insert_or_merge(edited);
    render();
    return true;
}

void EditorSession::toggle_keyframe(bool add) {
    KeyframeStore& store = selected().keyframes();
    if (add) {
        store.insert_or_merge(store.interpolate_keyframe(current_frame_));
    } else {
        store.remove(current_frame_);
    }
    render();
}

void EditorSession::reset_selected_layer() {
    selected().keyframes().reset();
    render();
}

void EditorSession::click(SDL_Point point) {
    if (tracking_mode_) {
        return;
    }
    TextLayer& layer = selected();
    const std::string text = layers_.content(layer.id()).value_or(layer.id());
    if (!layer.contains_point(point, current_frame_, text, text_service_)) {
        const std::vector<std::string> hits = layers_.layers_at(point, current_frame_, text_service_);
        if (!hits.empty()) {
            selected_id_ = hits.front();
            set_status("Selected " + selected_id_);
            return;
        }
    }

    Keyframe sticky;
    sticky.frame_index = current_frame_;
    sticky.position = point;
    sticky.size = layer.keyframes().interpolate(current_frame_).size;
    layer.keyframes().insert_or_merge(sticky);
    render();
}

std::string EditorSession::add_layer() {
    const std::string id = layers_.add_layer();
    selected_id_ = id;
    render();
    return id;
}

bool EditorSession::remove_selected_layer() {
    if (!layers_.remove_layer(selected_id_)) {
        return reject("A meme needs at least one text layer.");
    }
    selected_id_ = layers_.front().id();
    render();
    return true;
}

bool EditorSession::set_layer_content(const std::string& id, const std::string& text) {
    if (!layers_.set_content(id, text)) {
        return false;
    }
    render();
    return true;
}

bool EditorSession::set_font(const std::string& font) {
    if (!selected().set_font(font)) {
        return reject("Invalid font.");
    }
    render();
    return true;
}

bool EditorSession::set_text_color(const std::string& color) {
    if (!selected().set_text_color(color)) {
        return reject("Invalid colour '" + color + "'.");
    }
    render();
    return true;
}

bool EditorSession::set_background_color(const std::string& color) {
    std::optional<std::string> background;
    if (!strings::trim_copy(color).empty()) {
        background = color;
    }
    if (!selected().set_background_color(background)) {
        return reject("Invalid colour '" + color + "'.");
    }
    render();
    return true;
}

bool EditorSession::set_stroke_width(const std::string& width_text) {
    const std::optional<int> width = strings::parse_int(width_text);
    if (!width || !selected().set_stroke_width(*width)) {
        return reject("Invalid stroke width '" + width_text + "'.");
    }
    render();
    return true;
}

bool EditorSession::set_stroke_color(const std::string& color) {
    if (!selected().set_stroke_color(color)) {
        return reject("Invalid colour '" + color + "'.");
    }
    render();
    return true;
}

void EditorSession::set_tracking_mode(bool enabled) {
    tracking_mode_ = enabled;
    if (!enabled) {
        tracker_.reset();
    }
}

void EditorSession::pointer_press(SDL_Point point) {
    if (tracking_mode_) {
        tracker_.press(point);
    }
}

void EditorSession::pointer_drag(SDL_Point point) {
    if (tracking_mode_) {
        tracker_.drag(point);
    }
}

bool EditorSession::pointer_release(SDL_Point point) {
    if (!tracking_mode_ || original_.empty()) {
        return false;
    }
    if (!tracker_.release(point, original_.at(current_frame_))) {
        return reject("Could not start tracking that region.");
    }
    set_status("Tracking " + selected_id_);
    return true;
}

TrackStep EditorSession::track_step(int direction) {
    TrackStep step = tracker_.step(direction, current_frame_, original_, selected().keyframes());
    if (step.failed) {
        set_status("Lost track of the region. Select it again.");
        return step;
    }
    if (step.advanced) {
        current_frame_ = step.next_index;
        render();
    }
    return step;
}

void EditorSession::render() {
    rendered_ = original_.copy();
    if (!layers_.render_active_first(rendered_, layers_.contents(), current_frame_, text_service_, refresh_hook_)) {
        log::debug("[EditorSession] Preview rendered with missing captions");
    }
}

bool EditorSession::save_document(const std::filesystem::path& path) {
    if (path.empty()) {
        return reject("File not saved");
    }
    const std::filesystem::path gif_path = document_store::gif_path_for(path);
    try {
        utils::StagedWrite document = document_store::stage_document(path, layers_.to_json());
        original_.save(gif_path);
        document.commit();
    } catch (const std::exception& ex) {
        log::error(std::string("[EditorSession] save failed: ") + ex.what());
        return reject(std::string("File not saved: ") + ex.what());
    }
    set_status("Saved template to " + path.string() + " and " + gif_path.string());
    return true;
}

bool EditorSession::export_gif(const std::filesystem::path& path) {
    try {
        rendered_.save(path, original_.loop());
    } catch (const std::exception& ex) {
        log::error(std::string("[EditorSession] export failed: ") + ex.what());
        return reject(std::string("Export failed: ") + ex.what());
    }
    set_status("Exported " + path.string());
    return true;
}

}
