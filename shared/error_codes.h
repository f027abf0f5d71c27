#ifndef TABBRIDGE_ERROR_CODES_H
#define TABBRIDGE_ERROR_CODES_H

#include <cstdlib>
#include <iostream>
#include <QString>

namespace TabBridgeCommon {

    // Process exit codes. Ranges leave room per area.
    enum class ExitCode : int {
        SUCCESS = 0,

        // Startup (1-19)
        INVALID_ARGUMENTS = 2,

        // Logging (100-109)
        LOG_DIR_CREATE_FAILED = 101,

        // Bridge (110-119)
        LIFECYCLE_FAILED = 110,   // FAILED state, retries exhausted
        SHUTDOWN_FAILED = 111     // Cleanup error or the shutdown cap fired
    };

    inline const char* exitCodeToString(ExitCode code) {
        switch (code) {
            case ExitCode::SUCCESS: return "Success";
            case ExitCode::INVALID_ARGUMENTS: return "Invalid command line arguments";
            case ExitCode::LOG_DIR_CREATE_FAILED: return "Failed to create log directory";
            case ExitCode::LIFECYCLE_FAILED: return "Bridge could not start after exhausting retries";
            case ExitCode::SHUTDOWN_FAILED: return "Shutdown did not complete cleanly";
        }
        return "Unknown error";
    }

    // Print the reason to stderr and exit. Only for failures before the event loop runs.
    [[noreturn]] inline void exitWithError(ExitCode code, const QString& detail = QString()) {
        std::cerr << "Error: " << exitCodeToString(code);
        if (!detail.isEmpty()) {
            std::cerr << " (" << detail.toStdString() << ")";
        }
        std::cerr << std::endl;
        std::exit(static_cast<int>(code));
    }
}

#endif // TABBRIDGE_ERROR_CODES_H
