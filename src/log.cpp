#include <collate/log.hpp>
#include <collate/configuration.hpp>

#include <boost/json.hpp>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace collate {

static std::tm & launch_time()
{
    static struct LaunchTime : public std::tm
    {
        LaunchTime()
        {
            auto now = std::chrono::system_clock::now();
            std::time_t now_time_t = std::chrono::system_clock::to_time_t(now);
            gmtime_r(&now_time_t, this);
        }
    } launch_tm;
    return launch_tm;
}

static std::ofstream & logf()
{
    static struct LogStream : public std::ofstream
    {
        LogStream()
        {
            std::stringstream logfn_ss;
            logfn_ss << std::put_time(&launch_time(), "%FT%TZ.log");
            try {
                open(std::string(Configuration::path_local(collate::span<std::string_view>({
                    "logs",
                    logfn_ss.str()
                }))), std::ios::app);
            } catch (std::invalid_argument const&) {
                // no .collate directory: the stream stays closed and records are dropped
            }
        }
    } logf;
    return logf;
}

void Log::log(std::span<StringViewPair const> fields)
{
    static std::mutex mtx;
    boost::json::object obj;

    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    for (auto&& [key, value] : fields) {
        obj[key] = value;
    }

    obj["ts"] = (double)now_ms / 1000.0;

    std::lock_guard<std::mutex> lock(mtx);
    logf() << obj << std::endl;
}

static struct EnsureLaunchTimeCreated
{
    EnsureLaunchTimeCreated()
    { launch_time(); }
} ensure_launchtime_created;

} // namespace collate
