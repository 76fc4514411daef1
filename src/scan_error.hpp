#ifndef SCAN_ERROR_HPP
#define SCAN_ERROR_HPP

// Failure reasons carried by DetectionResponse and the frame helpers.
// Values are part of the C bridge and must stay stable.
enum ScanError {
    SCAN_OK = 0,
    SCAN_RUNTIME_UNAVAILABLE = 1,  // Runtime failed to load, permanent for the session
    SCAN_NO_DOCUMENT_FOUND = 2,
    SCAN_FRAME_TOO_SMALL = 3,      // Rectified output below the minimum size
    SCAN_TIMEOUT = 4,
    SCAN_INVALID_FRAME = 5,        // Zero dimensions or pixel-count mismatch
    SCAN_NOT_READY = 6,            // Runtime still loading
    SCAN_CANCELLED = 7,            // Session ended while the request was pending
    SCAN_BUSY = 8,                 // Live request dropped, another one is outstanding
    SCAN_PROCESSING_FAILED = 9     // OpenCV raised inside the runtime
};

// Short snake_case identifier, used in JSON and logs
const char* scanErrorName(ScanError error);

// Human readable description
const char* scanErrorMessage(ScanError error);

// Only a runtime that failed to load is unrecoverable for the session
bool isPermanentError(ScanError error);

// Every failure degrades to the manual crop UI; timeouts count as "no document"
bool shouldFallBackToManualCrop(ScanError error);

#endif // SCAN_ERROR_HPP
