#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "rlog/log.hpp"

using namespace rlog;

namespace
{

const char *level_color(log_level level)
{
    switch (level)
    {
    case log_level::debug: return "\033[36m";
    case log_level::info: return "\033[32m";
    case log_level::warn: return "\033[33m";
    case log_level::error: return "\033[31m";
    default: return "";
    }
}

/**
 * Writes records to stderr in logfmt: msg="..." level=info key=value ...
 *
 * The application owns the backend; the facade only forwards records to it.
 */
class console_handler final : public log_handler
{
    log_level min_level_;
    bool use_color_;
    std::mutex mutex_; // Keep lines from different threads apart

  public:
    console_handler(log_level min_level, bool use_color) : min_level_(min_level), use_color_(use_color) {}

    bool enabled(log_level level) const override { return level >= min_level_; }

    void handle(const log_record &record) override
    {
        std::string line;
        if (use_color_) { line += level_color(record.level); }

        fmt::format_to(std::back_inserter(line), "msg=\"{}\" level={}", record.message, record.level);
        for (const auto &attr : record.attrs)
        {
            auto value = attr.value.to_string();
            if (value.find_first_of(" \"=") != std::string::npos)
            {
                fmt::format_to(std::back_inserter(line), " {}=\"{}\"", attr.key, value);
            }
            else { fmt::format_to(std::back_inserter(line), " {}={}", attr.key, value); }
        }

        if (use_color_) { line += "\033[0m"; }

        std::lock_guard<std::mutex> lock(mutex_);
        fmt::print(stderr, "{}\n", line);
    }
};

// Stand-ins for extensions compiled into the same executable. Each asks for
// its own logger, the records are told apart by the module attribute.
void run_storage_extension()
{
    auto log = get_logger("ext_storage");
    log.debug("scanning", "path", "/var/lib/demo");
    log.info("opened", "path", "/var/lib/demo/db", "entries", 1024);
}

void run_network_extension(int worker)
{
    auto log = get_logger("ext_network");
    log.info("listening", {{"port", 8080 + worker}, {"worker", worker}});
    if (worker == 1) { log.warn("slow handshake", "peer", "10.0.0.7:51234", "ms", 812.5); }
}

} // namespace

int main()
{
    // Must happen before any extension asks for a logger
    log_level level = log_level::info;
    if (auto configured = log_level_from_string(std::getenv("RLOG_LEVEL"))) { level = *configured; }

    set_default_handler(std::make_shared<console_handler>(level, true));

    // A separate backend for the audit trail, plain output
    register_handler("audit", std::make_shared<console_handler>(log_level::info, false));

    auto log = get_default_logger();
    log.info("starting", "version", VERSION, "level", level);

    run_storage_extension();

    std::vector<std::thread> workers;
    for (int i = 0; i < 2; ++i)
    {
        workers.emplace_back(run_network_extension, i);
    }
    for (auto &t : workers) { t.join(); }

    get_registered_logger("audit").info("configuration loaded", "user", "admin");

    log.error("shutting down", "reason", "demo finished");
    return 0;
}
