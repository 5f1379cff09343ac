#ifndef ERRORS_H
#define ERRORS_H

// Failure categories surfaced by the generation pipeline
enum class ErrorKind {
    None,
    InvalidConfig,
    FontLoad,        // font file unreadable or unparseable, or size unsupported
    FontDraw,        // metric / measurement failure while laying out or drawing
    FontExhaustion,  // no usable font remains after excluding failures
    TextGeneration,  // provider produced nothing valid
    Encoding,        // container / codec failure
    Render           // raster surface could not be allocated
};

const char* errorKindName(ErrorKind kind);

#endif // ERRORS_H
