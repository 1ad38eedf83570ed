#include "protocol/listener_registry.h"

#include <algorithm>
#include <utility>

namespace nvlink::protocol {

ListenerHandle ListenerRegistry::Register(
    std::uint16_t list_id,
    std::shared_ptr<const schema::ISchema> schema,
    ValueCallback callback) {
    if (schema == nullptr) {
        return kInvalidListenerHandle;
    }

    const std::size_t expected_byte_length = schema->ByteLength();
    listeners_.push_back(Listener{
        .handle = next_handle_++,
        .list_id = list_id,
        .expected_byte_length = expected_byte_length,
        .schema = std::move(schema),
        .value_callback = std::move(callback),
        .raw_callback = {},
    });
    return listeners_.back().handle;
}

ListenerHandle ListenerRegistry::Register(
    std::uint16_t list_id,
    std::size_t expected_byte_length,
    RawCallback callback) {
    listeners_.push_back(Listener{
        .handle = next_handle_++,
        .list_id = list_id,
        .expected_byte_length = expected_byte_length,
        .schema = nullptr,
        .value_callback = {},
        .raw_callback = std::move(callback),
    });
    return listeners_.back().handle;
}

bool ListenerRegistry::Unregister(ListenerHandle handle) {
    const auto it = std::find_if(listeners_.begin(), listeners_.end(), [handle](const Listener& listener) {
        return listener.handle == handle;
    });
    if (it == listeners_.end()) {
        return false;
    }

    listeners_.erase(it);
    return true;
}

void ListenerRegistry::Clear() {
    listeners_.clear();
}

std::vector<Listener> ListenerRegistry::Lookup(std::uint16_t list_id) const {
    std::vector<Listener> matches;
    for (const Listener& listener : listeners_) {
        if (listener.list_id == list_id) {
            matches.push_back(listener);
        }
    }
    return matches;
}

std::size_t ListenerRegistry::Size() const {
    return listeners_.size();
}

}  // namespace nvlink::protocol
