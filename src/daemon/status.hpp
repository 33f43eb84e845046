#pragma once

#include <functional>
#include <string>

enum class StatusKind {
    Ready,
    RecordingStarted,
    CaptureFailed,
    NoAudio,
    Captured,
    NoSpeech,
    Transcribed,
    TranscriptionFailed,
    CleanupUnavailable,
    CleanupFailed,
    Cleaned,
    Inserted,
    ClipboardOnly,
    InsertionFailed,
    RunFailed,
    RunComplete,
};

// One line on the console status stream. `detail` carries text or an error
// message, `seconds` a duration where the event has one.
struct StatusEvent {
    StatusKind kind;
    std::string detail;
    double seconds = 0.0;
};

using StatusCallback = std::function<void(const StatusEvent&)>;

bool is_error(StatusKind kind);

std::string format_status(const StatusEvent& ev);
