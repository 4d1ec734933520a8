#pragma once

#include <SDL.h>

#include <filesystem>
#include <functional>
#include <string>
#include <utility>

#include "composition/layer_set.hpp"
#include "sequence/sequence.hpp"
#include "text/text_service.hpp"
#include "tracking/tracking_keyframer.hpp"

namespace captionist {

// Values shown in the frame properties form. Editing is only allowed on explicit keyframes.
struct FrameProperties {
    int frame_index = 0;
    int x = 0;
    int y = 0;
    int size = 0;
    bool is_keyframe = false;
};

// Editing state behind a host UI: the source and rendered sequences, the layers, the
// selection, the current frame and the tracker. Every edit re-renders the sequence.
class EditorSession {
public:
    using RefreshHook = std::function<void(int)>;

    // Without a tracker factory the session tracks regions with OpenCvRegionTracker.

    EditorSession(Sequence sequence, const TextService& text_service, RegionTrackerFactory tracker_factory = {});
    EditorSession(Sequence sequence, LayerSet layers, const TextService& text_service,
                  RegionTrackerFactory tracker_factory = {});

    // Loads a GIF and, when present, its sibling layer document. Nothing changes on failure.
    bool open(const std::filesystem::path& gif_path);
    const std::filesystem::path& source_path() const { return source_path_; }

    const Sequence& original() const { return original_; }
    const Sequence& rendered() const { return rendered_; }
    const LayerSet& layers() const { return layers_; }

    // Called with the active frame index as soon as it has been re-rendered.
    void set_refresh_hook(RefreshHook hook) { refresh_hook_ = std::move(hook); }

    int frame_count() const { return original_.length(); }
    void set_frame(int index);
    int current_frame() const { return current_frame_; }

    bool select_layer(const std::string& id);
    const std::string& selected_layer_id() const { return selected_id_; }
    const TextLayer& selected_layer() const;

    FrameProperties frame_properties() const;
    bool apply_frame_properties(const std::string& x_text, const std::string& y_text, const std::string& size_text);
    void toggle_keyframe(bool add);
    void reset_selected_layer();

    // Selects another layer when the click lands on it, otherwise moves the selected
    // layer there at the current frame keeping its current size.
    void click(SDL_Point point);

    std::string add_layer();
    bool remove_selected_layer();
    bool set_layer_content(const std::string& id, const std::string& text);

    bool set_font(const std::string& font);
    bool set_text_color(const std::string& color);
    // An empty string removes the background.
    bool set_background_color(const std::string& color);
    bool set_stroke_width(const std::string& width_text);
    bool set_stroke_color(const std::string& color);

    void set_tracking_mode(bool enabled);
    bool tracking_mode() const { return tracking_mode_; }
    const TrackingKeyframer& tracker() const { return tracker_; }
    void pointer_press(SDL_Point point);
    void pointer_drag(SDL_Point point);
    bool pointer_release(SDL_Point point);
    TrackStep track_step(int direction);

    void render();

    // Writes the layer document and the unrendered GIF beside it.
    bool save_document(const std::filesystem::path& path);
    bool export_gif(const std::filesystem::path& path);

    const std::string& status() const { return status_; }

private:
    TextLayer& selected();
    void set_status(const std::string& message);
    bool reject(const std::string& message);

    Sequence original_;
    Sequence rendered_;
    LayerSet layers_;
    const TextService& text_service_;
    TrackingKeyframer tracker_;
    RefreshHook refresh_hook_;
    std::string selected_id_;
    int current_frame_ = 0;
    bool tracking_mode_ = false;
    std::filesystem::path source_path_;
    std::string status_;
};

}
