#include "petalite/cache/slot_lru.hpp"

namespace petalite::cache {

SlotLru::SlotLru(u32 capacity) : m_nodes(capacity) {
    m_index.reserve(capacity);
}

std::optional<u32> SlotLru::find(const text::GlyphKey& key) const {
    auto it = m_index.find(key);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<u32> SlotLru::touch(const text::GlyphKey& key, u64 batch) {
    auto it = m_index.find(key);
    if (it == m_index.end()) {
        return std::nullopt;
    }

    u32 slot = it->second;
    m_nodes[slot].last_batch = batch;
    if (m_head != slot) {
        unlink(slot);
        push_front(slot);
    }
    return slot;
}

Result<SlotAcquire, CacheError> SlotLru::acquire(const text::GlyphKey& key, u64 batch,
                                                 bool protect_batch) {
    SlotAcquire out;

    if (m_used < capacity()) {
        out.slot = m_used++;
    } else {
        if (m_tail == NIL) {
            // Zero capacity
            return make_error(CacheError::InvalidConfig);
        }
        Node& victim = m_nodes[m_tail];
        if (protect_batch && victim.last_batch == batch) {
            return make_error(CacheError::TierExhausted);
        }

        out.slot = m_tail;
        out.evicted = victim.key;
        m_index.erase(victim.key);
        unlink(out.slot);
        victim.occupied = false;
    }

    Node& node = m_nodes[out.slot];
    node.key = key;
    node.last_batch = batch;
    node.occupied = true;
    push_front(out.slot);
    m_index.emplace(key, out.slot);
    return out;
}

void SlotLru::clear() {
    for (auto& node : m_nodes) {
        node = Node{};
    }
    m_index.clear();
    m_head = NIL;
    m_tail = NIL;
    m_used = 0;
}

std::optional<text::GlyphKey> SlotLru::key_at(u32 slot) const {
    if (slot >= m_nodes.size() || !m_nodes[slot].occupied) {
        return std::nullopt;
    }
    return m_nodes[slot].key;
}

std::optional<u32> SlotLru::least_recent() const {
    if (m_tail == NIL) {
        return std::nullopt;
    }
    return m_tail;
}

std::vector<u32> SlotLru::recency_order() const {
    std::vector<u32> order;
    order.reserve(m_used);
    for (u32 slot = m_head; slot != NIL; slot = m_nodes[slot].older) {
        order.push_back(slot);
    }
    return order;
}

void SlotLru::unlink(u32 slot) {
    Node& node = m_nodes[slot];
    if (node.newer != NIL) {
        m_nodes[node.newer].older = node.older;
    } else {
        m_head = node.older;
    }
    if (node.older != NIL) {
        m_nodes[node.older].newer = node.newer;
    } else {
        m_tail = node.newer;
    }
    node.newer = NIL;
    node.older = NIL;
}

void SlotLru::push_front(u32 slot) {
    Node& node = m_nodes[slot];
    node.newer = NIL;
    node.older = m_head;
    if (m_head != NIL) {
        m_nodes[m_head].newer = slot;
    }
    m_head = slot;
    if (m_tail == NIL) {
        m_tail = slot;
    }
}

} // namespace petalite::cache
