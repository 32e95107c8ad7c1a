#pragma once

#include "balloon/core/types.h"
#include "balloon/interaction/interaction_session.h"
#include "balloon/interaction/pick_system.h"
#include "balloon/persistence/project_snapshot.h"
#include "balloon/render/draw_surface.h"
#include "balloon/text/font_size_fitter.h"

#include <cstdint>
#include <string>
#include <vector>

namespace balloon {

/**
 * BalloonEngine: owns the scene (background image, bubbles, selection and
 * stacking order, tool defaults) and routes commands, pointer input,
 * export and persistence through the pure shape/text/interaction modules.
 *
 * Commands report failure through their return value and record it in
 * lastError(); a successful command resets it to Ok.
 */
class BalloonEngine {
public:
    BalloonEngine();

    // ==============================================================================
    // Image and canvas
    // ==============================================================================

    // Replaces the background and clears the scene. The canvas fits the image
    // into 90% x 80% of the viewport without upscaling. Fails on a
    // non-positive image size.
    bool setImage(const ImageRef& image, float viewportWidth, float viewportHeight);
    bool hasImage() const noexcept { return hasImage_; }
    const ImageRef& image() const noexcept { return image_; }
    const CanvasSize& canvasSize() const noexcept { return canvas_; }

    // ==============================================================================
    // Bubbles
    // ==============================================================================

    // New bubble from the tool defaults centered on (x, y), kept inside the
    // canvas and selected. Returns its id, 0 when no image is loaded.
    std::uint32_t addBubble(float x, float y);

    // Selects and raises the bubble; 0 clears the selection.
    bool selectBubble(std::uint32_t id);
    // Replaces the stored bubble with the same id (sanitized).
    bool updateBubble(const Bubble& bubble);
    bool deleteBubble(std::uint32_t id);
    // Drops image, bubbles and selection; stacking restarts.
    void clearAll();

    // Stores edited markup; empty text falls back to the placeholder.
    bool commitText(std::uint32_t id, const std::string& markup);
    // Fits the bubble's font size to its safe zone using `surface` to measure.
    bool autoFitText(std::uint32_t id, DrawSurface& surface, const text::FitOptions& options = {});

    const std::vector<Bubble>& bubbles() const noexcept { return bubbles_; }
    const Bubble* findBubble(std::uint32_t id) const;
    std::uint32_t selectedId() const noexcept { return selectedId_; }
    std::uint32_t nextZIndex() const noexcept { return nextZIndex_; }

    // ==============================================================================
    // Tool settings
    // ==============================================================================
    const ToolSettings& toolSettings() const noexcept { return toolSettings_; }
    // Updates the defaults and the selected bubble's font, size and colors.
    void applyToolSettings(const ToolSettings& settings);
    // Thought and Shout only.
    bool cycleShapeVariant(std::uint32_t id, std::int32_t delta);
    // Clamped to [kMinFontSize, kMaxFontSize].
    bool adjustFontSize(std::uint32_t id, float delta);

    // ==============================================================================
    // Pointer input (canvas coordinates)
    // ==============================================================================
    PickResult pointerDown(float x, float y);
    bool pointerMove(float x, float y);
    void pointerUp();
    // Restores the bubble to its state before the gesture.
    void cancelGesture();
    GestureMode gestureMode() const noexcept { return session_.mode(); }

    // ==============================================================================
    // Export and persistence
    // ==============================================================================

    // Draws every bubble in stacking order; handles are never drawn.
    BalloonError exportScene(DrawSurface& surface);

    // BLNP bytes of the project; empty (InvalidOperation) without an image.
    std::vector<std::uint8_t> saveProject();
    BalloonError loadProject(const std::uint8_t* data, std::uint32_t byteCount);

    BalloonError lastError() const noexcept { return lastError_; }

private:
    Bubble* findMutable(std::uint32_t id);
    std::uint32_t allocateId() { return nextId_++; }
    std::vector<Part> defaultParts(BubbleType type, float width, float height);
    void syncToolSettingsFrom(const Bubble& bubble);
    bool fail(BalloonError error);
    bool succeed();

    bool hasImage_ = false;
    ImageRef image_;
    CanvasSize canvas_{800.0f, 600.0f};

    std::vector<Bubble> bubbles_;
    std::uint32_t selectedId_ = 0;
    std::uint32_t nextId_ = 1;
    std::uint32_t nextZIndex_ = kInitialZIndex;
    ToolSettings toolSettings_;

    PickSystem pickSystem_;
    InteractionSession session_;

    BalloonError lastError_ = BalloonError::Ok;
};

} // namespace balloon
