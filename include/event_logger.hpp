#pragma once

#include <string>
#include <cctype>
#include <exception>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace throttle {

// Logs limiter and harness events. Rate-limit keys are blinded (salted hash)
// so user or client identifiers never reach the log stream in clear text.
class EventLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };
    
    enum class EventType {
        FAIL_OPEN,
        CONFIG_INVALID,
        WORKER_LOST,
        PHASE_STARTED,
        PHASE_COMPLETED,
        STORE_UNAVAILABLE
    };
    
    /**
     * Records an event with a blinded subject identifier.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param subject Rate-limit key or component name (keys are blinded before logging).
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& subject, 
                   const std::string& message = "") {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        
        struct tm gmt;
        gmtime_r(&time_t, &gmt);
        
        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] ";
        
        ss << "key=" << blind(subject);
        
        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        
        // Log to appropriate destination based on severity
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    // Blinds an identifier with the current process salt.
    // Subjects wrapped in angle brackets (e.g. "<harness>") are component names and pass through.
    static std::string blind(const std::string& subject) {
        if (subject.empty() || (subject.front() == '<' && subject.back() == '>')) {
            return subject;
        }

        std::string data = subject + current_salt();
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
        
        std::stringstream hs;
        for(int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }
    
    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }
    
    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::FAIL_OPEN: return "FAIL_OPEN";
            case EventType::CONFIG_INVALID: return "CONFIG_INVALID";
            case EventType::WORKER_LOST: return "WORKER_LOST";
            case EventType::PHASE_STARTED: return "PHASE_START";
            case EventType::PHASE_COMPLETED: return "PHASE_DONE";
            case EventType::STORE_UNAVAILABLE: return "STORE_DOWN";
            default: return "UNKNOWN_EVENT";
        }
    }

private:
    // Salt Rotation:
    // A random salt is generated and rotated every 6 hours, so blinded keys
    // from different periods cannot be correlated.
    static std::string current_salt() {
        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::lock_guard<std::mutex> lock(salt_mutex);
        auto now_steady = std::chrono::steady_clock::now();
        if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
            unsigned char b[32];
            if (RAND_bytes(b, 32) != 1) {
                std::cerr << "[CRITICAL] CSPRNG failure in EventLogger. Terminating instance for safety.\n";
                std::terminate(); 
            }
            std::stringstream salt_ss;
            for(int i=0; i<32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
            log_salt = salt_ss.str();
            last_rotation = now_steady;
        }
        return log_salt;
    }
};

}
