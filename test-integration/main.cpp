#include <rlog/log.hpp>

#include <cstdio>
#include <memory>

using namespace rlog;

namespace
{
// Counts what arrives, prints nothing
class counting_handler final : public log_handler
{
  public:
    int handled = 0;

    bool enabled(log_level level) const override { return level >= log_level::info; }
    void handle(const log_record &) override { ++handled; }
};
} // namespace

int main()
{
    auto handler = std::make_shared<counting_handler>();
    set_default_handler(handler);

    // Test basic logging
    get_default_logger().info("Integration test successful!");
    get_default_logger().debug("Debug message");
    get_logger("integration").warn("Warning message", "user_id", 12345, "ip", "192.168.1.1");

    if (handler->handled != 2)
    {
        std::fprintf(stderr, "expected 2 records, got %d\n", handler->handled);
        return 1;
    }
    return 0;
}
