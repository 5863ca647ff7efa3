#include "core/context.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <system_error>

namespace fs = std::filesystem;

namespace cloudlink
{
    namespace
    {

        std::tm localTime(std::time_t value)
        {
            std::tm out{};
#ifdef _WIN32
            localtime_s(&out, &value);
#else
            localtime_r(&value, &out);
#endif
            return out;
        }

    } // namespace

    std::string timestampNow()
    {
        const auto now = std::chrono::system_clock::now();
        const std::tm tm = localTime(std::chrono::system_clock::to_time_t(now));
        const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

        std::ostringstream out;
        out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
        return out.str();
    }

    std::string timestampCompact()
    {
        const std::tm tm = localTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
        std::ostringstream out;
        out << std::put_time(&tm, "%Y%m%d_%H%M%S");
        return out.str();
    }

    std::string formatTimestamp(std::time_t value)
    {
        const std::tm tm = localTime(value);
        std::ostringstream out;
        out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        return out.str();
    }

    bool Context::openLogFile(const fs::path &file)
    {
        std::error_code ec;
        if (file.has_parent_path())
        {
            fs::create_directories(file.parent_path(), ec);
        }

        auto stream = std::make_unique<std::ofstream>(file, std::ios::app);
        if (!stream->is_open())
        {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        file_ = std::move(stream);
        logFile_ = file;
        return true;
    }

    void Context::write(std::ostream &stream, const char *prefix, const char *level, const std::string &message) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (console_)
        {
            stream << prefix << message << '\n';
        }
        if (file_)
        {
            *file_ << timestampNow() << " - " << level << " - " << message << '\n';
            file_->flush();
        }
    }

    void Context::writeFileOnly(const char *level, const std::string &message) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_)
        {
            *file_ << timestampNow() << " - " << level << " - " << message << '\n';
            file_->flush();
        }
    }

} // namespace cloudlink
