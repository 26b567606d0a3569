#pragma once

#include "types/context.hpp"

namespace flock {

class IRenderer {
  public:
    virtual ~IRenderer() = default;
    virtual void render(Context &ctx) = 0;
};

} // namespace flock
