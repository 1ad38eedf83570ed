#pragma once

#include "schema/schema.h"
#include "wire/byte_io.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace nvlink::protocol {

using ListenerHandle = std::uint64_t;

inline constexpr ListenerHandle kInvalidListenerHandle = 0;

struct Listener;

using ValueCallback = std::function<void(const schema::Value& value, const Listener& listener)>;
using RawCallback = std::function<void(wire::ByteSpan message, const Listener& listener)>;

// A listener holds either a schema plus value callback, or a raw byte callback.
struct Listener final {
    ListenerHandle handle = kInvalidListenerHandle;
    std::uint16_t list_id = 0;
    std::size_t expected_byte_length = 0;
    std::shared_ptr<const schema::ISchema> schema;
    ValueCallback value_callback;
    RawCallback raw_callback;
};

// Listeners keyed by NVL list ID. Not thread-safe; owned by one session.
class ListenerRegistry final {
public:
    ListenerHandle Register(
        std::uint16_t list_id,
        std::shared_ptr<const schema::ISchema> schema,
        ValueCallback callback);
    ListenerHandle Register(
        std::uint16_t list_id,
        std::size_t expected_byte_length,
        RawCallback callback);

    bool Unregister(ListenerHandle handle);
    void Clear();

    // Copies in registration order, so callbacks may unregister while being dispatched.
    std::vector<Listener> Lookup(std::uint16_t list_id) const;
    std::size_t Size() const;

private:
    ListenerHandle next_handle_ = 1;
    std::vector<Listener> listeners_;
};

}  // namespace nvlink::protocol
