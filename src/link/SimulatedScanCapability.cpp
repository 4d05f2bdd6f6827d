#include "SimulatedScanCapability.hpp"

namespace scanlink {
SimulatedScanCapability::SimulatedScanCapability(
    std::chrono::milliseconds _stepInterval, int _totalSteps)
    : stepInterval(_stepInterval),
      totalSteps(_totalSteps),
      nextListenerId(0),
      stopRequested(false) {}

SimulatedScanCapability::~SimulatedScanCapability() { stopScan(); }

CapabilityOutcome SimulatedScanCapability::startScan(const string& token) {
  std::unique_lock<std::mutex> lock(scanMutex);
  if (scanThread) {
    if (!stopRequested) {
      return CapabilityOutcome::failure("A scan is already running");
    }
    // The previous scan finished on its own
    lock.unlock();
    joinScanThread();
    lock.lock();
  }
  stopRequested = false;
  scanThread.reset(
      new std::thread(&SimulatedScanCapability::runScan, this, token));
  LOG(INFO) << "Simulated scan started for session " << maskToken(token);
  return CapabilityOutcome::ok();
}

CapabilityOutcome SimulatedScanCapability::stopScan() {
  {
    lock_guard<std::mutex> guard(scanMutex);
    if (!scanThread) {
      return CapabilityOutcome::ok();
    }
    stopRequested = true;
  }
  scanCv.notify_all();
  joinScanThread();
  return CapabilityOutcome::ok();
}

void SimulatedScanCapability::joinScanThread() {
  shared_ptr<std::thread> thread;
  {
    lock_guard<std::mutex> guard(scanMutex);
    thread = scanThread;
    scanThread.reset();
  }
  if (thread && thread->joinable()) {
    thread->join();
  }
}

void SimulatedScanCapability::setUploadTarget(const string& host) {
  lock_guard<std::mutex> guard(scanMutex);
  uploadTarget = host;
}

string SimulatedScanCapability::getUploadTarget() {
  lock_guard<std::mutex> guard(scanMutex);
  return uploadTarget;
}

int64_t SimulatedScanCapability::addListener(CapabilityListener listener) {
  lock_guard<std::recursive_mutex> guard(listenerMutex);
  int64_t id = nextListenerId++;
  listeners[id] = listener;
  return id;
}

void SimulatedScanCapability::removeListener(int64_t listenerId) {
  lock_guard<std::recursive_mutex> guard(listenerMutex);
  listeners.erase(listenerId);
}

void SimulatedScanCapability::emit(const string& name, const json& body) {
  lock_guard<std::recursive_mutex> guard(listenerMutex);
  CapabilityEvent event;
  event.name = name;
  event.body = body;
  for (auto& it : listeners) {
    it.second(event);
  }
}

void SimulatedScanCapability::runScan(string token) {
  el::Helpers::setThreadName("simulated-scan");
  emit(INSTRUCTION_EVENT,
       {{"message", "Move slowly around the room, pointing at the walls"}});
  for (int step = 1; step <= totalSteps; step++) {
    {
      std::unique_lock<std::mutex> lock(scanMutex);
      if (scanCv.wait_for(lock, stepInterval,
                          [this] { return stopRequested; })) {
        LOG(INFO) << "Simulated scan stopped at step " << step;
        return;
      }
    }
    json stats = {
        {"walls", std::min(4, 1 + step / 3)},
        {"doors", step >= totalSteps / 2 ? 1 : 0},
        {"windows", step / 10},
        {"openings", 0},
        {"objects", step / 4},
        {"progress", double(step) / totalSteps},
    };
    emit(SCAN_UPDATE_EVENT, stats);
  }
  emit(SCAN_COMPLETE_EVENT, {{"message", "Scan complete"}});
  {
    lock_guard<std::mutex> guard(scanMutex);
    // Marks the thread as finished so that the next start joins it
    stopRequested = true;
  }
  LOG(INFO) << "Simulated scan for " << maskToken(token) << " complete";
}
}  // namespace scanlink
