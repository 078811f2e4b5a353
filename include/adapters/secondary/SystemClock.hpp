#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>

namespace finger::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() const override {
        return domain::Timestamp(std::chrono::system_clock::now());
    }
};

} // namespace finger::adapters::secondary
