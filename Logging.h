// Logging.h
#pragma once

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <shared_mutex>
#include <atomic>

enum class LogType {
    SYSTEM,  // Default, always show
    INGRESS, // Hub -> Bridge
    EGRESS   // Bridge -> Hub
};

void AddLog(const std::string& msg, LogType type = LogType::SYSTEM);

// --- Global Logging & Notification System ---
extern std::shared_mutex g_log_mutex;
extern std::deque<std::string> g_logs;
extern std::atomic<bool> g_log_show_ingress; // Show (Hub -> Bridge)
extern std::atomic<bool> g_log_show_egress;  // Show (Bridge -> Hub)
extern std::atomic<bool> g_log_echo_stdout;  // Headless daemon mirrors the buffer to stdout
extern const size_t g_log_max_lines;         // Max log lines

struct Notification {
    std::string message;
    double expiry_time; // Seconds on the steady clock
    bool is_success;
};

extern std::vector<Notification> g_notifications;
extern std::mutex g_notification_mutex;

void PushNotification(const std::string& message, bool is_success);

// Copies of the buffers for rendering
std::vector<std::string> GetLogSnapshot();
std::vector<Notification> GetActiveNotifications();
void ClearLogs();

double SteadySeconds();
