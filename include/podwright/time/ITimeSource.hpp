#pragma once
#include <cstdint>

namespace podwright {

// Wall clock seam. Research stamps and run identifiers read time through
// this so tests can pin it.
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace podwright
