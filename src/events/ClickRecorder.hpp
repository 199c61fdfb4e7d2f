#pragma once

#include "store/Types.hpp"

namespace slugline {
namespace events {

/**
 * Sink the click pipeline persists events into
 */
class ClickRecorder {
public:
    virtual ~ClickRecorder() = default;

    /**
     * @throws std::exception on any persistence failure
     */
    virtual void recordClick(const store::ClickEvent& event) = 0;
};

} // namespace events
} // namespace slugline
