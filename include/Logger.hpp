#pragma once
#include <iostream>
#include <string>
#include <functional>

namespace ehlers {

// Process logger for the indicator library and its tools
class Logger {
public:
    using LogCallback = std::function<void(const std::string&)>;

    static void Log(const std::string& message) {
        if (callback_) {
            callback_(message);
        } else {
            std::cout << "[SSF] " << message << std::endl;
        }
    }

    static void SetCallback(LogCallback cb) {
        callback_ = cb;
    }

    static void ClearCallback() {
        callback_ = nullptr;
    }

    static void SetVerbose(bool verbose) {
        verbose_ = verbose;
    }

    static bool IsVerbose() {
        return verbose_;
    }

private:
    static inline LogCallback callback_ = nullptr;
    static inline bool verbose_ = true;
};

} // namespace ehlers
