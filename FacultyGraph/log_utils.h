#pragma once

#include <string>
#include <iostream>
#include <mutex>
#include <atomic>

using namespace std;

// Tagged line logging. Progress goes to stdout, problems to stderr.

inline atomic<bool>& infoLoggingFlag() {
    static atomic<bool> enabled{ true };
    return enabled;
}

inline mutex& logMutex() {
    static mutex m;
    return m;
}

inline void setLogVerbosity(bool showInfo) {
    infoLoggingFlag().store(showInfo);
}

inline void logInfo(const string& msg) {
    if (!infoLoggingFlag().load()) return;
    lock_guard<mutex> lock(logMutex());
    cout << "[INFO] " << msg << "\n";
}

inline void logOk(const string& msg) {
    if (!infoLoggingFlag().load()) return;
    lock_guard<mutex> lock(logMutex());
    cout << "[OK] " << msg << "\n";
}

inline void logWarn(const string& tag, const string& msg) {
    lock_guard<mutex> lock(logMutex());
    cerr << "[" << tag << "] " << msg << "\n";
}

inline void logError(const string& msg) {
    lock_guard<mutex> lock(logMutex());
    cerr << "[ERROR] " << msg << "\n";
}
