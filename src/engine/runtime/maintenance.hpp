#pragma once
#include <ostream>
#include "../../core/clock/clock.hpp"
#include "../../core/config/config.hpp"

namespace Trawl {
namespace Engine {

// Operator commands that run instead of a crawl. Results are printed to `out` as JSON.
class Maintenance {
public:
    Maintenance(const Core::Config& config, std::ostream& out);

    // 0 on success, 1 when the action did not do what was asked.
    int run();

private:
    int proxies();
    int checkpoints();

    const Core::Config& config_;
    std::ostream&       out_;
    Core::SystemClock   clock_;
};

}  // namespace Engine
}  // namespace Trawl
