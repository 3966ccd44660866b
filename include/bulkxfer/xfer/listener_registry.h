#ifndef BULKXFER_XFER_LISTENER_REGISTRY_H
#define BULKXFER_XFER_LISTENER_REGISTRY_H

#include "bulkxfer/xfer/listener.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace bulkxfer {

using TransmitterPtr = std::shared_ptr<TransmitterListener>;
using TransmitterList = std::vector<TransmitterPtr>;

// Listeners captured at one instant, safe to walk after the owner's lock is released
struct ListenerSnapshot {
    std::shared_ptr<const TransmitterList> transmitters;
    std::shared_ptr<ReceiverListener> receiver;
};

// Transmitters plus at most one receiver. Not synchronized: the owning tracker
// guards it with its own lock. The transmitter list is copy-on-write, so a snapshot
// taken before an add or remove keeps seeing the old list.
class ListenerRegistry {
public:
    ListenerRegistry();

    void add_transmitter(const TransmitterPtr& transmitter);

    // Returns false if the transmitter was not registered
    bool remove_transmitter(const TransmitterListener* transmitter);

    // Throws BulkXferError(ProtocolViolation) if a live receiver is already attached.
    // Returns false if this receiver was attached already.
    bool set_receiver(const std::shared_ptr<ReceiverListener>& receiver);
    void clear_receiver();
    bool has_receiver() const { return !receiver_.expired(); }

    size_t transmitter_count() const { return transmitters_->size(); }

    std::shared_ptr<const TransmitterList> transmitters() const { return transmitters_; }
    ListenerSnapshot snapshot() const;

    // Fan-out over a snapshot, sequentially on the calling thread
    static void notify_block_received(const std::shared_ptr<const TransmitterList>& transmitters,
                                      uint32_t block);
    static void notify_aborted(const ListenerSnapshot& listeners);

private:
    std::shared_ptr<const TransmitterList> transmitters_;
    std::weak_ptr<ReceiverListener> receiver_;
};

} // namespace bulkxfer

#endif // BULKXFER_XFER_LISTENER_REGISTRY_H
