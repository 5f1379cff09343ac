#include "errors.h"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:           return "None";
        case ErrorKind::InvalidConfig:  return "InvalidConfig";
        case ErrorKind::FontLoad:       return "FontLoadError";
        case ErrorKind::FontDraw:       return "FontDrawError";
        case ErrorKind::FontExhaustion: return "FontExhaustionError";
        case ErrorKind::TextGeneration: return "TextGenerationFailure";
        case ErrorKind::Encoding:       return "EncodingError";
        case ErrorKind::Render:         return "RenderError";
    }
    return "Unknown";
}
