#include "infrastructure/network/ProbeWorkers.hpp"

namespace uptimegrid::infra {

ProbeWorkers::ProbeWorkers(std::size_t threadCount, core::LoggerPtr logger)
    : threadCount_(threadCount > 0 ? threadCount : 1),
      pool_(threadCount_),
      logger_(std::move(logger)) {
    logger_->debug("Probe workers started with {} threads", threadCount_);
}

ProbeWorkers::~ProbeWorkers() {
    finish();
}

void ProbeWorkers::finish() {
    if (finished_.exchange(true)) {
        return;
    }
    pool_.join();
    logger_->debug("Probe workers finished");
}

} // namespace uptimegrid::infra
