#include "scan_error.hpp"

const char* scanErrorName(ScanError error) {
    switch (error) {
        case SCAN_OK: return "ok";
        case SCAN_RUNTIME_UNAVAILABLE: return "runtime_unavailable";
        case SCAN_NO_DOCUMENT_FOUND: return "no_document_found";
        case SCAN_FRAME_TOO_SMALL: return "frame_too_small";
        case SCAN_TIMEOUT: return "timeout";
        case SCAN_INVALID_FRAME: return "invalid_frame";
        case SCAN_NOT_READY: return "not_ready";
        case SCAN_CANCELLED: return "cancelled";
        case SCAN_BUSY: return "busy";
        case SCAN_PROCESSING_FAILED: return "processing_failed";
    }
    return "unknown";
}

const char* scanErrorMessage(ScanError error) {
    switch (error) {
        case SCAN_OK: return "OK";
        case SCAN_RUNTIME_UNAVAILABLE: return "Image processing runtime is unavailable";
        case SCAN_NO_DOCUMENT_FOUND: return "No document found";
        case SCAN_FRAME_TOO_SMALL: return "Corrected page is too small";
        case SCAN_TIMEOUT: return "Detection timed out";
        case SCAN_INVALID_FRAME: return "Invalid image data";
        case SCAN_NOT_READY: return "Image processing runtime is not ready";
        case SCAN_CANCELLED: return "Capture session ended";
        case SCAN_BUSY: return "Detection already in progress";
        case SCAN_PROCESSING_FAILED: return "Image processing failed";
    }
    return "Unknown error";
}

bool isPermanentError(ScanError error) {
    return error == SCAN_RUNTIME_UNAVAILABLE;
}

bool shouldFallBackToManualCrop(ScanError error) {
    return error != SCAN_OK;
}
