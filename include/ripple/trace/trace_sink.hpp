#pragma once

#include "ripple/trace/trace_event.hpp"

namespace ripple::trace {

class TraceSink {
 public:
  virtual ~TraceSink() = default;
  virtual void OnEvent(const TraceEvent& event) = 0;
};

}  // namespace ripple::trace
