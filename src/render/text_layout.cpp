#include "text_layout.h"
#include "../utils/logging.h"
#include "include/core/SkFont.h"
#include "include/core/SkFontTypes.h"
#include <algorithm>

int computeLineHeight(float metric_height, float font_size, float spread) {
    int line_height = static_cast<int>(metric_height * spread);
    if (line_height <= 0.8f * font_size) {
        line_height = static_cast<int>(1.2f * font_size * spread);
    }
    return line_height;
}

namespace {

LayoutResult drawFailure(const FontHandle& font, const std::string& what) {
    LayoutResult result;
    result.error = ErrorKind::FontDraw;
    result.message = what + " with font " + font.path();
    return result;
}

}  // namespace

LayoutResult computeTextLayout(const TextSnippet& snippet,
                               const std::string& highlight,
                               const FontHandle& font,
                               const FrameSpec& spec,
                               float y_offset) {
    if (!font.valid()) {
        return drawFailure(font, "cannot measure text");
    }

    const SkFont regular = font.regularFont();
    const SkFont bold = font.boldFont();
    const FontMetricsInfo& metrics = font.metrics();
    const float width = static_cast<float>(spec.width);
    const float height = static_cast<float>(spec.height);

    LayoutResult result;
    TextLayout& layout = result.layout;
    layout.phrase = highlight;
    layout.highlight_line_index = snippet.highlight_line_index;
    layout.line_height = static_cast<float>(computeLineHeight(metrics.height(), font.size(), spec.vertical_spread));
    layout.box_padding = font.size() * 0.10f;
    layout.shadow_offset = std::max(1, static_cast<int>(font.size() * 0.02f));
    if (layout.line_height <= 0.0f) {
        return drawFailure(font, "degenerate line height");
    }

    // Highlight box from the bold face
    SkRect bold_bounds;
    const float bold_advance = bold.measureText(highlight.c_str(), highlight.size(), SkTextEncoding::kUTF8, &bold_bounds);
    if (bold_advance <= 0.0f || bold_bounds.height() <= 0.0f) {
        return drawFailure(font, "zero-size bold glyphs for \"" + highlight + "\"");
    }
    layout.highlight_width = bold_advance;
    layout.highlight_height = bold_bounds.height();
    layout.highlight_x = (width - layout.highlight_width) / 2.0f;
    layout.highlight_y = (height - layout.highlight_height) / 2.0f;
    layout.highlight_baseline = layout.highlight_y - bold_bounds.fTop;

    // The highlight line's top sits on the highlight box's top
    layout.block_start_y = layout.highlight_y - snippet.highlight_line_index * layout.line_height;

    for (size_t i = 0; i < snippet.lines.size(); i++) {
        const std::string& text = snippet.lines[i];
        PlacedLine placed;
        placed.text = text;
        placed.baseline = layout.block_start_y + static_cast<float>(i) * layout.line_height + metrics.ascent + y_offset;

        if (static_cast<int>(i) == snippet.highlight_line_index) {
            const size_t pos = text.find(highlight);
            if (pos == std::string::npos) {
                return drawFailure(font, "highlight line does not contain the phrase");
            }
            const std::string prefix = text.substr(0, pos);
            float prefix_width = 0.0f;
            if (!prefix.empty()) {
                prefix_width = regular.measureText(prefix.c_str(), prefix.size(), SkTextEncoding::kUTF8);
                if (prefix_width <= 0.0f) {
                    return drawFailure(font, "zero-width prefix on line " + std::to_string(i));
                }
            }
            placed.x = layout.highlight_x - prefix_width;
        } else {
            const float line_width = regular.measureText(text.c_str(), text.size(), SkTextEncoding::kUTF8);
            if (line_width <= 0.0f) {
                return drawFailure(font, "zero-width line " + std::to_string(i));
            }
            float x = std::max(20.0f, (width - line_width) / 2.0f);
            if (line_width < width * 0.3f) {
                // Short lines stay inside the central column
                x = std::max(x, (width - width * 0.7f) / 2.0f);
            }
            placed.x = x;
        }
        layout.lines.push_back(placed);
    }

    LOG_DEBUG("Layout: line height " << layout.line_height << ", highlight box " << layout.highlight_width
              << "x" << layout.highlight_height << " at (" << layout.highlight_x << ", " << layout.highlight_y << ")");
    return result;
}
