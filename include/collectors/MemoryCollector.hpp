#pragma once
#include "model/Snapshot.hpp"

namespace penenv::collectors {

class MemoryCollector {
public:
  bool sample(penenv::model::Memory& out) const; // returns true on success
};

} // namespace penenv::collectors
