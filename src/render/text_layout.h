#ifndef TEXT_LAYOUT_H
#define TEXT_LAYOUT_H

#include "../core/errors.h"
#include "../core/run_config.h"
#include "../text/font_catalog.h"
#include "../text/text_snippet.h"
#include "include/core/SkRect.h"
#include <string>
#include <vector>

// One full line of the background text, drawn with the regular face
struct PlacedLine {
    std::string text;
    float x = 0.0f;
    float baseline = 0.0f;
};

// Every position a frame needs. Computed once per frame and shared by the
// background pass and the highlight overlay so the two cannot drift apart.
struct TextLayout {
    std::vector<PlacedLine> lines;
    int highlight_line_index = -1;
    std::string phrase;

    float line_height = 0.0f;
    float block_start_y = 0.0f;

    // Bold ink box of the phrase, centered in the frame
    float highlight_x = 0.0f;
    float highlight_y = 0.0f;
    float highlight_width = 0.0f;
    float highlight_height = 0.0f;
    float highlight_baseline = 0.0f;

    float box_padding = 0.0f;
    int shadow_offset = 1;

    SkRect highlightBox() const {
        return SkRect::MakeLTRB(highlight_x - box_padding, highlight_y - box_padding,
                                highlight_x + highlight_width + box_padding,
                                highlight_y + highlight_height + box_padding);
    }
};

struct LayoutResult {
    TextLayout layout;
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool success() const { return error == ErrorKind::None; }
};

// Distance between consecutive baselines. Falls back to 1.2 * size * spread
// when the metric height is degenerate.
int computeLineHeight(float metric_height, float font_size, float spread);

// Lay out snippet for one frame. y_offset shifts the background lines only;
// the highlight box always stays centered. Measurement failures (zero-size
// glyphs, empty advances) are reported as FontDraw.
LayoutResult computeTextLayout(const TextSnippet& snippet,
                               const std::string& highlight,
                               const FontHandle& font,
                               const FrameSpec& spec,
                               float y_offset);

#endif // TEXT_LAYOUT_H
