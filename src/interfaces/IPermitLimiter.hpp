#pragma once
#include <cstddef>

namespace Fanout {

class IPermitLimiter {
public:
    virtual ~IPermitLimiter() = default;
    virtual void Acquire() = 0;
    virtual bool TryAcquire() = 0;
    virtual void Release() = 0;
};

}
