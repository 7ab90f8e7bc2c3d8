#include "geostream/streaming/LoadTypes.h"

const char* toString(LoadStrategy strategy) {
    switch (strategy) {
        case LoadStrategy::Standard:
            return "standard";
        case LoadStrategy::Chunked:
            return "chunked";
        case LoadStrategy::Lod:
            return "lod";
    }
    return "unknown";
}

const char* toString(LevelQuality quality) {
    switch (quality) {
        case LevelQuality::Placeholder:
            return "placeholder";
        case LevelQuality::Preview:
            return "preview";
        case LevelQuality::Medium:
            return "medium";
        case LevelQuality::Lod:
            return "lod";
        case LevelQuality::Full:
            return "full";
    }
    return "unknown";
}

const char* toString(LoadStatus status) {
    switch (status) {
        case LoadStatus::Complete:
            return "complete";
        case LoadStatus::Failed:
            return "failed";
        case LoadStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

const char* toString(LoadErrorKind kind) {
    switch (kind) {
        case LoadErrorKind::Cancelled:
            return "cancelled";
        case LoadErrorKind::Timeout:
            return "timeout";
        case LoadErrorKind::DecodeError:
            return "decode-error";
        case LoadErrorKind::ResourceExhausted:
            return "resource-exhausted";
        case LoadErrorKind::WorkerUnavailable:
            return "worker-unavailable";
        case LoadErrorKind::Internal:
            return "internal";
    }
    return "unknown";
}

std::string userMessageFor(LoadErrorKind kind) {
    switch (kind) {
        case LoadErrorKind::Cancelled:
            return "Loading was cancelled.";
        case LoadErrorKind::Timeout:
            return "Loading took too long. Try a smaller file or a lower performance profile.";
        case LoadErrorKind::DecodeError:
            return "The model file could not be read. It may be corrupted or in an unsupported format.";
        case LoadErrorKind::ResourceExhausted:
            return "Not enough memory to load this model. Reduce model size or enable low-memory mode.";
        case LoadErrorKind::WorkerUnavailable:
            return "Background processing is unavailable and the model could not be loaded on this thread.";
        case LoadErrorKind::Internal:
            return "An unexpected error occurred while loading the model.";
    }
    return "An unexpected error occurred while loading the model.";
}

std::string ProgressEvent::label() const {
    switch (phase) {
        case LoadPhase::Downloading:
            return "downloading";
        case LoadPhase::Parsing:
            return "parsing";
        case LoadPhase::Preview:
            return "preview";
        case LoadPhase::Lod:
            return "lod-" + std::to_string(level.value_or(0));
        case LoadPhase::MediumQuality:
            return "medium-quality";
    }
    return "unknown";
}
