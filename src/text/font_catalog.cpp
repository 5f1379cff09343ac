#include "font_catalog.h"
#include "../utils/logging.h"
#include "../utils/string_utils.h"
#include "include/core/SkFontMetrics.h"
#include "include/core/SkFontTypes.h"
#include "include/core/SkRect.h"
#include "include/ports/SkFontMgr_fontconfig.h"
#include "include/ports/SkFontScanner_FreeType.h"
#include <fontconfig/fontconfig.h>
#include <algorithm>
#include <filesystem>
#include <iterator>

FontHandle::FontHandle(std::string path, std::string bold_path, float size,
                       sk_sp<SkTypeface> regular, sk_sp<SkTypeface> bold)
    : path_(std::move(path)),
      bold_path_(std::move(bold_path)),
      size_(size),
      regular_(std::move(regular)),
      bold_(std::move(bold)) {}

SkFont FontHandle::regularFont() const {
    SkFont font(regular_, size_);
    font.setEdging(SkFont::Edging::kAntiAlias);
    font.setSubpixel(true);
    return font;
}

SkFont FontHandle::boldFont() const {
    SkFont font(bold_ ? bold_ : regular_, size_);
    font.setEdging(SkFont::Edging::kAntiAlias);
    font.setSubpixel(true);
    return font;
}

const FontMetricsInfo& FontHandle::metrics() const {
    if (!metrics_) {
        FontMetricsInfo info;
        SkFont font = regularFont();
        SkFontMetrics fm;
        font.getMetrics(&fm);
        info.ascent = -fm.fAscent;
        info.descent = fm.fDescent;
        if (info.height() <= 0.0f) {
            // Some fonts ship without usable vertical metrics
            SkRect bounds;
            font.measureText("Ay", 2, SkTextEncoding::kUTF8, &bounds);
            info.ascent = -bounds.fTop;
            info.descent = bounds.fBottom;
            info.from_metrics = false;
        }
        metrics_ = info;
    }
    return *metrics_;
}

std::vector<std::string> boldVariantCandidates(const std::string& path) {
    static const char* kBoldSuffixes[] = {"-Bold", "bd", "b", "_Bold", " Bold"};

    std::filesystem::path p(path);
    const std::string ext = p.extension().string();
    const std::string base = (p.parent_path() / p.stem()).string();

    std::string stripped = base;
    replaceAllInPlace(stripped, "Regular", "");
    replaceAllInPlace(stripped, "regular", "");
    if (stripped != base) {
        while (!stripped.empty() && (stripped.back() == '-' || stripped.back() == '_' || stripped.back() == ' ')) {
            stripped.pop_back();
        }
    }

    std::vector<std::string> candidates;
    auto add = [&](const std::string& candidate) {
        if (candidate != path && std::find(candidates.begin(), candidates.end(), candidate) == candidates.end()) {
            candidates.push_back(candidate);
        }
    };
    for (const char* suffix : kBoldSuffixes) {
        if (stripped != base && !stripped.empty()) {
            add(stripped + suffix + ext);
        }
        add(base + suffix + ext);
    }
    return candidates;
}

bool isFontFileName(const std::string& path) {
    std::string ext = toLower(std::filesystem::path(path).extension().string());
    return ext == ".ttf" || ext == ".otf";
}

std::vector<std::string> findSystemFontFiles() {
    std::vector<std::string> files;
    if (!FcInit()) {
        LOG_WARN("FcInit() failed; system fonts unavailable");
        return files;
    }

    FcPattern* pattern = FcPatternCreate();
    FcObjectSet* objects = FcObjectSetBuild(FC_FILE, static_cast<char*>(nullptr));
    FcFontSet* fontSet = FcFontList(nullptr, pattern, objects);
    if (fontSet) {
        for (int i = 0; i < fontSet->nfont; i++) {
            FcChar8* file = nullptr;
            if (FcPatternGetString(fontSet->fonts[i], FC_FILE, 0, &file) == FcResultMatch && file) {
                std::string path(reinterpret_cast<const char*>(file));
                if (isFontFileName(path)) {
                    files.push_back(path);
                }
            }
        }
        FcFontSetDestroy(fontSet);
    }
    FcObjectSetDestroy(objects);
    FcPatternDestroy(pattern);

    std::sort(files.begin(), files.end());
    return files;
}

std::optional<std::string> findSystemSansSerif() {
    if (!FcInit()) {
        return std::nullopt;
    }

    FcPattern* pattern = FcNameParse(reinterpret_cast<const FcChar8*>("sans-serif"));
    if (!pattern) {
        return std::nullopt;
    }
    FcConfigSubstitute(nullptr, pattern, FcMatchPattern);
    FcDefaultSubstitute(pattern);

    std::optional<std::string> result;
    FcResult matchResult = FcResultNoMatch;
    FcPattern* match = FcFontMatch(nullptr, pattern, &matchResult);
    if (match) {
        FcChar8* file = nullptr;
        if (FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch && file) {
            result = std::string(reinterpret_cast<const char*>(file));
        }
        FcPatternDestroy(match);
    }
    FcPatternDestroy(pattern);
    return result;
}

FontCatalog::FontCatalog(bool allow_system_fallback)
    : allow_system_fallback_(allow_system_fallback) {
    const auto fcInitOk = FcInit();
    LOG_DEBUG("FcInit() returned " << (fcInitOk ? "true" : "false"));

    auto scanner = SkFontScanner_Make_FreeType();
    if (!scanner) {
        LOG_ERROR("SkFontScanner_Make_FreeType() returned nullptr; no font can be loaded");
        font_mgr_ = SkFontMgr::RefEmpty();
        return;
    }
    font_mgr_ = SkFontMgr_New_FontConfig(nullptr, std::move(scanner));
    if (!font_mgr_) {
        LOG_ERROR("Failed to create fontconfig font manager");
        font_mgr_ = SkFontMgr::RefEmpty();
    }
}

size_t FontCatalog::discover(const std::string& font_dir) {
    fonts_.clear();

    std::error_code ec;
    if (!font_dir.empty() && std::filesystem::is_directory(font_dir, ec)) {
        LOG_DEBUG("Looking for fonts in " << font_dir);
        for (const auto& entry : std::filesystem::directory_iterator(font_dir, ec)) {
            if (entry.is_regular_file(ec) && isFontFileName(entry.path().string())) {
                fonts_.insert(entry.path().string());
            }
        }
    } else {
        LOG_DEBUG("Font directory not found: " << (font_dir.empty() ? "(none)" : font_dir));
    }

    if (fonts_.empty() && allow_system_fallback_) {
        LOG_DEBUG("No fonts in font directory, searching system fonts...");
        for (const auto& path : findSystemFontFiles()) {
            fonts_.insert(path);
        }
    }

    LOG_DEBUG("Found " << fonts_.size() << " candidate fonts");
    return fonts_.size();
}

std::optional<std::string> FontCatalog::select(const std::set<std::string>& excluded, RandomSource& rng) const {
    std::vector<std::string> usable;
    std::set_difference(fonts_.begin(), fonts_.end(), excluded.begin(), excluded.end(),
                        std::back_inserter(usable));
    if (!usable.empty()) {
        return rng.pick(usable);
    }

    if (!allow_system_fallback_) {
        return std::nullopt;
    }

    auto fallback = findSystemSansSerif();
    if (fallback && excluded.count(*fallback) == 0) {
        LOG_WARN("No usable fonts left in catalog, using system fallback: " << *fallback);
        return fallback;
    }
    return std::nullopt;
}

std::optional<std::string> FontCatalog::selectPreferring(const std::string& font_dir,
                                                         const std::string& pinned,
                                                         const std::set<std::string>& excluded,
                                                         RandomSource& rng) const {
    if (!pinned.empty() && pinned != "random") {
        std::string candidate = (std::filesystem::path(font_dir) / pinned).string();
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && excluded.count(candidate) == 0) {
            return candidate;
        }
        LOG_WARN("Selected font " << pinned << " not usable, falling back to random selection");
    }
    return select(excluded, rng);
}

FontLoadResult FontCatalog::loadForSize(const std::string& path, float size) const {
    FontLoadResult result;

    if (size <= 0.0f || size > 2048.0f) {
        result.error = ErrorKind::FontLoad;
        result.message = "Unsupported font size " + std::to_string(size) + " for " + path;
        return result;
    }

    auto cached = loaded_.find(std::make_pair(path, size));
    if (cached != loaded_.end()) {
        result.font = cached->second;
        return result;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.error = ErrorKind::FontLoad;
        result.message = "Font file not found: " + path;
        return result;
    }

    sk_sp<SkTypeface> regular = font_mgr_->makeFromFile(path.c_str(), 0);
    if (!regular) {
        result.error = ErrorKind::FontLoad;
        result.message = "Failed to load font: " + path;
        return result;
    }
    if (regular->countGlyphs() <= 0) {
        result.error = ErrorKind::FontLoad;
        result.message = "Font has no glyphs: " + path;
        return result;
    }

    std::string bold_path;
    sk_sp<SkTypeface> bold;
    for (const auto& candidate : boldVariantCandidates(path)) {
        if (!std::filesystem::is_regular_file(candidate, ec)) {
            continue;
        }
        bold = font_mgr_->makeFromFile(candidate.c_str(), 0);
        if (bold) {
            bold_path = candidate;
            break;
        }
    }
    result.font = FontHandle(path, bold_path, size, std::move(regular), std::move(bold));
    if (result.font.hasBoldVariant()) {
        LOG_DEBUG("Loaded " << path << " at " << size << "px, bold variant " << result.font.boldPath());
    } else {
        LOG_DEBUG("Loaded " << path << " at " << size << "px, no bold variant, highlight uses the regular face");
    }
    loaded_.emplace(std::make_pair(path, size), result.font);
    return result;
}
