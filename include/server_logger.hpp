#pragma once

#include <string>
#include <cctype>
#include <exception>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace redirector {

// Event log for the redirect and certificate paths. Remote addresses are
// blinded with a rotating random salt before they reach the output.
class ServerLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        FALLBACK,
        DNS_FAILURE,
        CERT_ADMISSION,
        CERT_ISSUANCE,
        RATE_LIMIT_HIT,
        STORE_FAILURE,
        CONNECTION_REJECTED,
        LIFECYCLE
    };

    /**
     * Records an event.
     * @param level Severity level of the event.
     * @param event Category of the event.
     * @param remote_addr Peer address (blinded before logging), or "internal".
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                   const std::string& message = "") {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] ";

        ss << "ip=" << blind_address(remote_addr, gmt);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
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

private:
    static std::string blind_address(const std::string& remote_addr, const struct tm& gmt) {
        if (remote_addr == "unknown" || remote_addr == "internal") {
            return remote_addr;
        }

        // The salt is random per process and rotated every 6 hours, so
        // address hashes cannot be correlated across rotations.
        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::string salt;
        {
            std::lock_guard<std::mutex> lock(salt_mutex);
            auto now_steady = std::chrono::steady_clock::now();
            if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
                unsigned char b[32];
                if (RAND_bytes(b, 32) != 1) {
                    std::cerr << "[CRITICAL] CSPRNG failure in ServerLogger. Terminating instance.\n";
                    std::terminate();
                }
                std::stringstream salt_ss;
                for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
                log_salt = salt_ss.str();
                last_rotation = now_steady;

                std::cout << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] [INFO] [LIFECYCLE] msg=\"address blinding salt rotated\"\n";
            }
            salt = log_salt;
        }

        std::string data = remote_addr + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
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
            case EventType::FALLBACK: return "FALLBACK";
            case EventType::DNS_FAILURE: return "DNS_FAILURE";
            case EventType::CERT_ADMISSION: return "CERT_ADMISSION";
            case EventType::CERT_ISSUANCE: return "CERT_ISSUANCE";
            case EventType::RATE_LIMIT_HIT: return "RATE_LIMIT";
            case EventType::STORE_FAILURE: return "STORE_FAILURE";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
