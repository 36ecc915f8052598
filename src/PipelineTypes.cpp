#include "PipelineTypes.h"

std::string stageErrorKindToString(StageErrorKind kind) {
    switch (kind) {
        case StageErrorKind::InsufficientData: return "InsufficientData";
        case StageErrorKind::Vectorization: return "Vectorization";
        case StageErrorKind::Training: return "Training";
        case StageErrorKind::Persistence: return "Persistence";
        case StageErrorKind::Source: return "Source";
    }
    return "Unknown";
}

std::string StageError::describe() const {
    std::string out = "[" + stage + "] " + stageErrorKindToString(kind);
    if (!category.empty()) {
        out += " " + category;
        if (polarity) out += "/" + polarityToString(*polarity);
    }
    out += ": " + message;
    return out;
}
