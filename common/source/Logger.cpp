#include "Logger.hpp"

#include <sstream>

Logger::Logger(const std::string& filename)
    : filename_(filename)
    , stopping_(false)
    , writing_(false) {
    logging_thread_ = std::thread([this]() {
        while (true) {
            std::string message;
            {
                std::unique_lock<std::mutex> lk(mx_);
                cv_log.wait(lk, [this]{ return !logs_.empty() || stopping_; });
                if (logs_.empty()) {
                    break;
                }
                message = logs_[0];
                logs_.pop_front();
                writing_ = true;
            }

            WriteLine(message);

            {
                std::lock_guard<std::mutex> lock(mx_);
                writing_ = false;
                if (logs_.empty()) {
                    cv_flushed.notify_all();
                }
            }
        }
    });
}

void Logger::WriteLine(const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);

    std::tm timeinfo;
    localtime_r(&now_c, &timeinfo);

    std::ostringstream oss;
    oss << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S");
    std::string timestamp = oss.str();

    std::ofstream file(filename_, std::ios::app);
    if (file.is_open()) {
        file << "[" << timestamp << "] " << message << "\n";
        file.close();
    } else {
        std::cerr << "Failed to open log file " << filename_ << std::endl;
    }
}

void Logger::Log(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mx_);
        logs_.push_back(message);
        cv_log.notify_one();
    }
}

void Logger::Flush() {
    std::unique_lock<std::mutex> lk(mx_);
    cv_flushed.wait(lk, [this]{ return logs_.empty() && !writing_; });
}

Logger::~Logger() {
    {
        std::lock_guard<std::mutex> lock(mx_);
        stopping_ = true;
        cv_log.notify_one();
    }
    logging_thread_.join();
}
