#include "scheduler.h"

TimerHandle::~TimerHandle() { cancel(); }

TimerHandle::TimerHandle(TimerHandle &&other) noexcept
    : m_scheduler(other.m_scheduler), m_id(other.m_id) {
  other.m_scheduler = nullptr;
  other.m_id = kInvalidTimerId;
}

TimerHandle &TimerHandle::operator=(TimerHandle &&other) noexcept {
  if (this != &other) {
    cancel();
    m_scheduler = other.m_scheduler;
    m_id = other.m_id;
    other.m_scheduler = nullptr;
    other.m_id = kInvalidTimerId;
  }
  return *this;
}

void TimerHandle::cancel() {
  if (m_scheduler != nullptr && m_id != kInvalidTimerId) {
    m_scheduler->cancelTimer(m_id);
  }
  m_scheduler = nullptr;
  m_id = kInvalidTimerId;
}

bool TimerHandle::pending() const {
  if (m_scheduler == nullptr || m_id == kInvalidTimerId) {
    return false;
  }
  return m_scheduler->isPending(m_id);
}
