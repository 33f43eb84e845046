#include "status.hpp"

#include <format>

bool is_error(StatusKind kind) {
    switch (kind) {
        case StatusKind::CaptureFailed:
        case StatusKind::TranscriptionFailed:
        case StatusKind::CleanupFailed:
        case StatusKind::InsertionFailed:
        case StatusKind::RunFailed:
            return true;
        default:
            return false;
    }
}

std::string format_status(const StatusEvent& ev) {
    switch (ev.kind) {
        case StatusKind::Ready:
            return std::format("Ready. Hold [{}] to dictate, release to transcribe. Ctrl+C to quit.",
                               ev.detail);
        case StatusKind::RecordingStarted:
            return "Recording...";
        case StatusKind::CaptureFailed:
            return "Could not start recording: " + ev.detail;
        case StatusKind::NoAudio:
            return "No audio captured.";
        case StatusKind::Captured:
            return std::format("Captured {:.1f}s of audio. Transcribing...", ev.seconds);
        case StatusKind::NoSpeech:
            return "(no speech detected)";
        case StatusKind::Transcribed:
            return std::format("Raw ({:.2f}s): {}", ev.seconds, ev.detail);
        case StatusKind::TranscriptionFailed:
            return "Transcription failed: " + ev.detail;
        case StatusKind::CleanupUnavailable:
            return "No API key, skipping cleanup.";
        case StatusKind::CleanupFailed:
            return "Cleanup failed, using raw text: " + ev.detail;
        case StatusKind::Cleaned:
            return std::format("Cleaned ({:.2f}s): {}", ev.seconds, ev.detail);
        case StatusKind::Inserted:
            return std::format("Inserted ({:.2f}s).", ev.seconds);
        case StatusKind::ClipboardOnly:
            return "Text copied to clipboard (auto-paste unavailable). Press Ctrl+V to paste.";
        case StatusKind::InsertionFailed:
            return "Insertion failed: " + ev.detail;
        case StatusKind::RunFailed:
            return "Pipeline failed: " + ev.detail;
        case StatusKind::RunComplete:
            return std::format("Done ({:.2f}s total).", ev.seconds);
    }
    return {};
}
