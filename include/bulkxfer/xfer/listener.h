#ifndef BULKXFER_XFER_LISTENER_H
#define BULKXFER_XFER_LISTENER_H

#include <cstdint>

namespace bulkxfer {

// Re-serves received blocks to another peer. Callbacks run synchronously on the
// thread that delivered the block or triggered the abort, with no tracker lock held,
// so they may call back into the tracker.
class TransmitterListener {
public:
    virtual ~TransmitterListener() = default;

    virtual void on_block_received(uint32_t block) = 0;
    virtual void on_aborted() = 0;
};

// Local consumer of the completed transfer
class ReceiverListener {
public:
    virtual ~ReceiverListener() = default;

    virtual void on_aborted() = 0;
};

} // namespace bulkxfer

#endif // BULKXFER_XFER_LISTENER_H
