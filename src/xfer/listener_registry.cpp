#include "bulkxfer/xfer/listener_registry.h"
#include "bulkxfer/base/error_code.h"

namespace bulkxfer {

ListenerRegistry::ListenerRegistry()
    : transmitters_(std::make_shared<const TransmitterList>()) {}

void ListenerRegistry::add_transmitter(const TransmitterPtr& transmitter) {
    auto next = std::make_shared<TransmitterList>(*transmitters_);
    next->push_back(transmitter);
    transmitters_ = std::move(next);
}

bool ListenerRegistry::remove_transmitter(const TransmitterListener* transmitter) {
    auto next = std::make_shared<TransmitterList>();
    next->reserve(transmitters_->size());
    for (const auto& t : *transmitters_) {
        if (t.get() != transmitter) {
            next->push_back(t);
        }
    }
    if (next->size() == transmitters_->size()) {
        return false;
    }
    transmitters_ = std::move(next);
    return true;
}

bool ListenerRegistry::set_receiver(const std::shared_ptr<ReceiverListener>& receiver) {
    auto current = receiver_.lock();
    if (current) {
        if (current != receiver) {
            throw BulkXferError(ErrorCode::ProtocolViolation, "a receiver is already attached");
        }
        return false;
    }
    receiver_ = receiver;
    return true;
}

void ListenerRegistry::clear_receiver() {
    receiver_.reset();
}

ListenerSnapshot ListenerRegistry::snapshot() const {
    return ListenerSnapshot{transmitters_, receiver_.lock()};
}

void ListenerRegistry::notify_block_received(const std::shared_ptr<const TransmitterList>& transmitters,
                                             uint32_t block) {
    if (!transmitters) return;
    // Not a generic callback, so no catch guard
    for (const auto& t : *transmitters) {
        t->on_block_received(block);
    }
}

void ListenerRegistry::notify_aborted(const ListenerSnapshot& listeners) {
    if (listeners.transmitters) {
        for (const auto& t : *listeners.transmitters) {
            t->on_aborted();
        }
    }
    if (listeners.receiver) {
        listeners.receiver->on_aborted();
    }
}

} // namespace bulkxfer
