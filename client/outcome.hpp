#pragma once

#include <chrono>
#include <optional>
#include <string>

/**
 * @brief Category of a failed request. Every kind is local to one Outcome
 * and never stops a worker.
 */
enum class ErrorKind {
    Transport,          // connection / socket level failure
    UnexpectedStatus,   // response received, status not 200
    EmptyBody,          // download returned zero bytes
    NoDownloadTargets,  // identifier ring was empty
    ContentMismatch,    // landing page lacks the expected marker
    BadResponse,        // body could not be decoded
    Io                  // local fixture could not be read
};

struct RequestError {
    ErrorKind kind;
    int status = 0;      // only meaningful for UnexpectedStatus
    std::string message; // grouping key used by the reporter

    static RequestError transport(const std::string& what) {
        return RequestError{ErrorKind::Transport, 0, what};
    }

    static RequestError unexpected_status(int code) {
        return RequestError{ErrorKind::UnexpectedStatus, code,
                            "unexpected status code: " + std::to_string(code)};
    }
};

/**
 * @brief Result of one executed request. No error means success.
 */
struct Outcome {
    std::chrono::steady_clock::duration elapsed{};
    std::optional<RequestError> error;
};
