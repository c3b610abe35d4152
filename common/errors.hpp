#pragma once

// ============================================================
// errors.hpp -- Per-target failure taxonomy
//
// Every exception below is scoped to one target. The scheduler
// catches them and records the matching ErrorKind in that
// target's TransferOutcome; they never abort other targets.
// ============================================================

#include <stdexcept>
#include <string>
#include <vector>

enum class ErrorKind {
    NONE = 0,
    AUTHENTICATION,   // every credential candidate failed
    CONNECTION,       // unreachable, refused, timed out, host key rejected
    TRANSFER,         // I/O failure while moving bytes
    EXECUTION,        // post-transfer command could not run to completion
    POST_ACTION,      // post-transfer command exited non-zero
    INTERNAL,         // anything else
};

inline const char* error_kind_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:           return "none";
        case ErrorKind::AUTHENTICATION: return "AuthenticationExhausted";
        case ErrorKind::CONNECTION:     return "ConnectionError";
        case ErrorKind::TRANSFER:       return "TransferError";
        case ErrorKind::EXECUTION:      return "ExecutionError";
        case ErrorKind::POST_ACTION:    return "PostActionFailed";
        case ErrorKind::INTERNAL:       return "InternalError";
    }
    return "unknown";
}

class AuthenticationExhausted : public std::runtime_error {
public:
    AuthenticationExhausted(const std::string& host, std::vector<std::string> attempted)
        : std::runtime_error(build_message(host, attempted))
        , attempted_(std::move(attempted)) {}

    // Methods in the order they were tried, e.g. "publickey:/k", "password"
    const std::vector<std::string>& attempted() const { return attempted_; }

private:
    static std::string build_message(const std::string& host,
                                     const std::vector<std::string>& attempted) {
        std::string m = "authentication exhausted for " + host + " (tried: ";
        for (size_t i = 0; i < attempted.size(); ++i) {
            if (i) m += ", ";
            m += attempted[i];
        }
        if (attempted.empty()) m += "nothing";
        return m + ")";
    }

    std::vector<std::string> attempted_;
};

class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TransferError : public std::runtime_error {
public:
    TransferError(const std::string& msg, unsigned long long bytes_sent = 0)
        : std::runtime_error(msg), bytes_sent_(bytes_sent) {}

    // Bytes acknowledged by the remote before the failure
    unsigned long long bytes_sent() const { return bytes_sent_; }

private:
    unsigned long long bytes_sent_;
};

class ExecutionError : public std::runtime_error {
public:
    ExecutionError(const std::string& msg,
                   std::string partial_stdout = {},
                   std::string partial_stderr = {})
        : std::runtime_error(msg)
        , stdout_(std::move(partial_stdout))
        , stderr_(std::move(partial_stderr)) {}

    const std::string& partial_stdout() const { return stdout_; }
    const std::string& partial_stderr() const { return stderr_; }

private:
    std::string stdout_;
    std::string stderr_;
};

// Post-transfer command ran but exited non-zero
class PostActionFailed : public std::runtime_error {
public:
    PostActionFailed(const std::string& msg, int exit_code)
        : std::runtime_error(msg), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};
