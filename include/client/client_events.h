// include/client/client_events.h
#pragma once

namespace mapstore {

template<typename K>
class ClientAdapter;

// Published by ClientProvider on the session's EventBus. The referenced
// adapter is only valid for the duration of delivery.

template<typename K>
struct ClientCreatedEvent {
    ClientAdapter<K>& client;
};

template<typename K>
struct ClientUpdatedEvent {
    ClientAdapter<K>& client;
};

// Delivered before the client is deleted; the client is still readable.
template<typename K>
struct ClientRemovedEvent {
    ClientAdapter<K>& client;
};

} // namespace mapstore
