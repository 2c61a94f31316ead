#include "Logging.h"

#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <chrono>
#include <algorithm>

// --- Global Logging & Notification System ---
std::shared_mutex g_log_mutex;
std::deque<std::string> g_logs;
std::atomic<bool> g_log_show_ingress{ true };
std::atomic<bool> g_log_show_egress{ true };
std::atomic<bool> g_log_echo_stdout{ false };
const size_t g_log_max_lines = 1000;

std::vector<Notification> g_notifications;
std::mutex g_notification_mutex;

double SteadySeconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

void AddLog(const std::string& msg, LogType type) {
    if (type == LogType::INGRESS && !g_log_show_ingress) return;
    if (type == LogType::EGRESS && !g_log_show_egress) return;

    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &in_time_t);
#else
    localtime_r(&in_time_t, &tm_buf);
#endif
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%H:%M:%S");
    std::string line = "[" + ss.str() + "] " + msg;

    std::lock_guard<std::shared_mutex> lock(g_log_mutex);
    if (g_log_echo_stdout) {
        std::cout << line << std::endl;
    }
    g_logs.push_back(std::move(line));
    if (g_logs.size() > g_log_max_lines) {
        g_logs.pop_front();
    }
}

void PushNotification(const std::string& message, bool is_success) {
    AddLog((is_success ? "Notice: " : "Notice (failed): ") + message);
    std::lock_guard<std::mutex> lock(g_notification_mutex);
    g_notifications.push_back(Notification{ message, SteadySeconds() + 5.0, is_success });
}

std::vector<std::string> GetLogSnapshot() {
    std::shared_lock<std::shared_mutex> lock(g_log_mutex);
    return std::vector<std::string>(g_logs.begin(), g_logs.end());
}

std::vector<Notification> GetActiveNotifications() {
    std::lock_guard<std::mutex> lock(g_notification_mutex);
    double now = SteadySeconds();
    g_notifications.erase(std::remove_if(g_notifications.begin(), g_notifications.end(),
        [now](const Notification& n) { return n.expiry_time < now; }),
        g_notifications.end());
    return g_notifications;
}

void ClearLogs() {
    {
        std::lock_guard<std::shared_mutex> lock(g_log_mutex);
        g_logs.clear();
    }
    AddLog("Log cleared.");
}
