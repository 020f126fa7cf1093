#pragma once
#include "../transport.hpp"

namespace toolhost {

// One child per call: binary + rendered argv, stdin closed, both output
// streams collected until exit. Cancellation kills the child.
class StdioTransport : public Transport {
public:
    RawOutput invoke(const ActionCall& call) override;
    TransportMode mode() const override { return TransportMode::Stdio; }
};

} // namespace toolhost
