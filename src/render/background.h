#ifndef BACKGROUND_H
#define BACKGROUND_H

#include "../core/run_config.h"
#include "../utils/random_source.h"
#include "include/core/SkImage.h"
#include "include/core/SkRefCnt.h"
#include <string>

// Scale-to-cover geometry for fitting an orig_width x orig_height image into
// width x height: scale by max(width/orig_width, height/orig_height),
// truncate, crop the center. needs_resize is set when truncation left the
// crop smaller than the target.
struct CoverFit {
    int scaled_width = 0;
    int scaled_height = 0;
    int crop_left = 0;
    int crop_top = 0;
    int crop_width = 0;
    int crop_height = 0;
    bool needs_resize = false;
};

CoverFit computeCoverFit(int orig_width, int orig_height, int width, int height);

// media_dir/name when name has an extension or is an uploaded custom
// texture, otherwise media_dir/name.jpg
std::string textureFilePath(const std::string& media_dir, const std::string& name);

// Decode a named texture, cover-fit it to width x height and nudge
// brightness / contrast. nullptr when the name is "none", the file is missing
// or it cannot be decoded.
sk_sp<SkImage> loadTexture(const std::string& media_dir, const std::string& name, int width, int height);

// Procedural paper: base color, grain dots carrying Gaussian noise and a soft
// shadow along the edges
sk_sp<SkImage> makePaperTexture(const FrameSpec& spec, RandomSource& rng);

#endif // BACKGROUND_H
