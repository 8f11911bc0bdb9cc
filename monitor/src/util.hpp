#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
bool get_env_bool(const std::string& name, bool default_value);

// String utilities
// Keeps empty tokens so callers can reject "a=b,,c=d"
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);

// Time utilities
std::string current_iso8601();
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

// Milliseconds elapsed since start, rounded to two decimals
double elapsed_ms(const std::chrono::steady_clock::time_point& start);

// Set by a worker thread as its last action so owners can bound their join
class ExitSignal {
public:
    void notify();
    bool wait_for(std::chrono::milliseconds timeout);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool exited_ = false;
};

// Joins the thread if it signals exit within grace, otherwise detaches it.
// Returns true when the thread was joined.
bool join_or_detach(std::thread& thread, ExitSignal& exited, std::chrono::milliseconds grace);

} // namespace util
