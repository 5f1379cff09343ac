#ifndef FRAME_COMPOSITOR_H
#define FRAME_COMPOSITOR_H

#include "text_layout.h"
#include "../core/errors.h"
#include "../core/run_config.h"
#include "../text/font_catalog.h"
#include "../text/text_snippet.h"
#include "include/core/SkImage.h"
#include "include/core/SkRefCnt.h"
#include <string>

// One finished frame, width x height
struct RenderResult {
    sk_sp<SkImage> image;
    TextLayout layout;
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool success() const { return error == ErrorKind::None && image != nullptr; }
};

// Draws frames for one run. The output depends only on the snippet, the font,
// the frame spec, the frame index and the jitter passed in.
class FrameCompositor {
public:
    // Loads the named background texture once; without one every frame gets
    // procedural paper.
    FrameCompositor(const FrameSpec& spec, const std::string& highlight);

    RenderResult render(const TextSnippet& snippet, const FontHandle& font, int frame_index, float jitter) const;

    bool usesTexture() const { return texture_ != nullptr; }

private:
    sk_sp<SkImage> background(int frame_index) const;

    FrameSpec spec_;
    std::string highlight_;
    sk_sp<SkImage> texture_;
};

#endif // FRAME_COMPOSITOR_H
