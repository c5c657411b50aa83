#include "lb/balancer/HealthMonitor.h"
#include "lb/common/Logger.h"
#include "lb/monitor/Stats.h"

namespace lb {
namespace balancer {

HealthMonitor::HealthMonitor(lb::network::EventLoop* loop,
                             std::shared_ptr<const Topology> topology,
                             std::shared_ptr<HealthState> health,
                             HealthCheckerPtr checker,
                             double intervalSec)
    : loop_(loop),
      topology_(std::move(topology)),
      health_(std::move(health)),
      checker_(std::move(checker)),
      intervalSec_(intervalSec),
      timer_(0),
      tickInFlight_(false),
      completedTicks_(0),
      skippedTicks_(0) {
}

HealthMonitor::~HealthMonitor() {
    loop_->Cancel(timer_);
}

bool HealthMonitor::Start() {
    if (timer_ != 0) return true;

    std::weak_ptr<HealthMonitor> weakSelf = shared_from_this();
    timer_ = loop_->RunEvery(intervalSec_, [weakSelf] {
        if (auto self = weakSelf.lock()) self->RunTick();
    });
    if (timer_ == 0) {
        LOG_ERROR << "Health monitor timer could not be armed";
        return false;
    }

    LOG_INFO << "Health monitor started: " << topology_->BackendCount() << " backends, interval "
             << intervalSec_ << "s";
    RunTick();
    return true;
}

void HealthMonitor::Stop() {
    loop_->Cancel(timer_);
    timer_ = 0;
}

void HealthMonitor::RunTick() {
    if (tickInFlight_) {
        skippedTicks_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN << "Previous health check round still running, skipping this tick";
        return;
    }

    const size_t count = topology_->BackendCount();
    auto tick = std::make_shared<Tick>();
    tick->results.assign(count, false);
    tick->pending = count;
    tickInFlight_ = true;

    if (count == 0) {
        CommitTick(tick);
        return;
    }

    std::weak_ptr<HealthMonitor> weakSelf = shared_from_this();
    for (BackendId id = 0; id < count; ++id) {
        checker_->Check(topology_->backend(id), [weakSelf, tick, id](bool healthy) {
            if (auto self = weakSelf.lock()) {
                self->OnCheckResult(tick, id, healthy);
            }
        });
    }
}

void HealthMonitor::OnCheckResult(const std::shared_ptr<Tick>& tick, BackendId id, bool healthy) {
    tick->results[id] = healthy;
    if (--tick->pending == 0) {
        CommitTick(tick);
    }
}

void HealthMonitor::CommitTick(const std::shared_ptr<Tick>& tick) {
    std::vector<bool> previous;
    if (!health_->Commit(tick->results, &previous)) {
        LOG_ERROR << "Health commit rejected: " << tick->results.size() << " results for "
                  << health_->size() << " backends";
        tickInFlight_ = false;
        return;
    }
    tickInFlight_ = false;

    size_t healthyCount = 0;
    std::vector<lb::monitor::Stats::BackendSnapshot> snapshot;
    snapshot.reserve(tick->results.size());
    for (BackendId id = 0; id < tick->results.size(); ++id) {
        const bool now = tick->results[id];
        if (now) ++healthyCount;
        if (previous[id] != now) {
            LOG_INFO << "Backend " << topology_->backend(id).address << " is now " << (now ? "UP" : "DOWN");
        }
        snapshot.push_back({topology_->backend(id).address, now, topology_->IsPathRouted(id)});
    }
    lb::monitor::Stats::Instance().SetBackendSnapshot(std::move(snapshot));

    LOG_INFO << "Healthy backends: " << healthyCount << "/" << tick->results.size();
    LOG_DEBUG << "Stats: " << lb::monitor::Stats::Instance().ToJson();

    completedTicks_.fetch_add(1, std::memory_order_release);
    if (tickCallback_) tickCallback_(tick->results);
}

} // namespace balancer
} // namespace lb
