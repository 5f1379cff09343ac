#ifndef FONT_CATALOG_H
#define FONT_CATALOG_H

#include "../core/errors.h"
#include "../utils/random_source.h"
#include "include/core/SkFont.h"
#include "include/core/SkFontMgr.h"
#include "include/core/SkRefCnt.h"
#include "include/core/SkTypeface.h"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

// Vertical metrics of the regular face at the handle's size
struct FontMetricsInfo {
    float ascent = 0.0f;    // positive distance above the baseline
    float descent = 0.0f;   // positive distance below the baseline
    bool from_metrics = true;  // false when derived from the "Ay" bounding box

    float height() const { return ascent + descent; }
};

// A typeface loaded at one size, plus its best-effort bold variant.
// Default-constructed handles are invalid.
class FontHandle {
public:
    FontHandle() = default;
    FontHandle(std::string path, std::string bold_path, float size,
               sk_sp<SkTypeface> regular, sk_sp<SkTypeface> bold);

    bool valid() const { return regular_ != nullptr; }
    const std::string& path() const { return path_; }
    // Empty when no bold file was found (bold glyphs then use the regular face)
    const std::string& boldPath() const { return bold_path_; }
    bool hasBoldVariant() const { return !bold_path_.empty(); }
    float size() const { return size_; }

    SkFont regularFont() const;
    SkFont boldFont() const;

    // Computed on first use
    const FontMetricsInfo& metrics() const;

private:
    std::string path_;
    std::string bold_path_;
    float size_ = 0.0f;
    sk_sp<SkTypeface> regular_;
    sk_sp<SkTypeface> bold_;
    mutable std::optional<FontMetricsInfo> metrics_;
};

struct FontLoadResult {
    FontHandle font;
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool success() const { return error == ErrorKind::None; }
};

// Candidate bold file paths for a regular font path, most likely first.
// Pure filename heuristics ("-Bold", "bd", stripped "Regular" token).
std::vector<std::string> boldVariantCandidates(const std::string& path);

// True for .ttf / .otf (any case)
bool isFontFileName(const std::string& path);

// Every TrueType/OpenType file fontconfig knows about
std::vector<std::string> findSystemFontFiles();

// fontconfig's best match for a generic sans-serif family
std::optional<std::string> findSystemSansSerif();

class FontCatalog {
public:
    explicit FontCatalog(bool allow_system_fallback = true);

    // Scan font_dir for font files; when it has none (or does not exist) fall
    // back to the host's installed fonts. Returns the number of fonts found.
    size_t discover(const std::string& font_dir);

    const std::set<std::string>& available() const { return fonts_; }

    // Uniformly random path from available - excluded; when that is empty the
    // system sans-serif (unless excluded or disabled); otherwise none.
    std::optional<std::string> select(const std::set<std::string>& excluded, RandomSource& rng) const;

    // Like select(), but prefers font_dir/pinned when pinned names a usable file
    std::optional<std::string> selectPreferring(const std::string& font_dir,
                                                const std::string& pinned,
                                                const std::set<std::string>& excluded,
                                                RandomSource& rng) const;

    // Successful loads are cached per (path, size) for the catalog's lifetime
    FontLoadResult loadForSize(const std::string& path, float size) const;

    size_t cachedFontCount() const { return loaded_.size(); }

private:
    sk_sp<SkFontMgr> font_mgr_;
    std::set<std::string> fonts_;
    mutable std::map<std::pair<std::string, float>, FontHandle> loaded_;
    bool allow_system_fallback_;
};

#endif // FONT_CATALOG_H
