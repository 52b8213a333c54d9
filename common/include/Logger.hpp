#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <deque>
#include <thread>
#include <condition_variable>

// Appends timestamped lines to a file from a background thread.
class Logger {
public:
    Logger(const std::string& filename = "logs.txt");
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void Log(const std::string& message);
    // Blocks until every queued line has been written.
    void Flush();
    const std::string& GetFilename() const { return filename_; }
    ~Logger();

private:
    void WriteLine(const std::string& message);

    std::thread logging_thread_;
    std::deque<std::string> logs_;
    std::string filename_;
    std::mutex mx_;
    std::condition_variable cv_log;
    std::condition_variable cv_flushed;
    bool stopping_;
    bool writing_;
};

#endif // LOGGER_HPP
