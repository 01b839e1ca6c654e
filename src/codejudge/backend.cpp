#include <codejudge/backend.h>

void ExecutionMonitor::SetTerminator(std::function<void()> terminator) {
  std::lock_guard lck(mtx_);
  if (terminated_) {
    terminator();
    return;
  }
  terminator_ = std::move(terminator);
}

void ExecutionMonitor::ClearTerminator() {
  std::lock_guard lck(mtx_);
  terminator_ = nullptr;
}

// The terminator runs under the lock, so once ClearTerminator() returns
// no kill is in flight for the cleared unit.
void ExecutionMonitor::Terminate() {
  std::lock_guard lck(mtx_);
  if (terminated_) return;
  terminated_ = true;
  if (terminator_) terminator_();
}

bool ExecutionMonitor::Terminated() const {
  std::lock_guard lck(mtx_);
  return terminated_;
}
