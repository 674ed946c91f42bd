/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/core/Value.hxx>

#include <optional>
#include <unordered_map>
#include <vector>

namespace stash {

using RefId = Int;

/////////////////////////////////////////////////////////////////////////////
/// Detects objects reachable by more than one path during one write session.
/// - Identity is the address of the heap allocation behind a Value, so two
///   equal but distinct containers are tracked independently.
/// - Only lists, maps and user-defined objects participate.
/// - A reference id is assigned when an object is seen for the second time.
/// - Tracked objects are kept alive until @ref reset, so an address cannot
///   be reused by a different object during the session.
/////////////////////////////////////////////////////////////////////////////
class IdentityTracker
{
  public:
    struct Seen
    {
        bool is_first;
        RefId ref_id;           // valid when !is_first
        bool is_new_ref;        // ref_id was assigned by this call
        String canonical_path;  // where the object was first seen
    };

    struct Checkpoint
    {
        size_t n_entries;
        RefId next_ref_id;
    };

    IdentityTracker(bool enabled = true) : m_enabled{enabled} {}

    bool is_enabled() const { return m_enabled; }

    static bool participates(const Value& value) {
        switch (value.type()) {
            case Value::LIST:
            case Value::MAP:
            case Value::OPAQUE: return true;
            default:            return false;
        }
    }

    /// Record an encounter with `value` at `path`.
    /// - Always a first encounter if tracking is disabled, or the value does
    ///   not participate.
    Seen mark_seen(const Value& value, const String& path) {
        if (!m_enabled || !participates(value))
            return {true, 0, false, path};

        auto id = value.id();
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            m_entries.emplace(id, Entry{value, path, std::nullopt});
            m_order.push_back(id);
            return {true, 0, false, path};
        }

        auto& entry = it->second;
        bool is_new_ref = false;
        if (!entry.ref_id) {
            entry.ref_id = m_next_ref_id++;
            is_new_ref = true;
        }
        return {false, *entry.ref_id, is_new_ref, entry.canonical_path};
    }

    /// Forget all objects seen so far.
    /// - Reference ids continue to increase, so ids are unique within the
    ///   archive.
    void reset() {
        m_entries.clear();
        m_order.clear();
    }

    size_t size() const { return m_entries.size(); }

    Checkpoint checkpoint() const { return {m_order.size(), m_next_ref_id}; }

    /// Forget objects first seen, and reference ids assigned, after the
    /// checkpoint was taken.
    void rollback(const Checkpoint& checkpoint) {
        while (m_order.size() > checkpoint.n_entries) {
            m_entries.erase(m_order.back());
            m_order.pop_back();
        }
        for (auto& [id, entry] : m_entries)
            if (entry.ref_id && *entry.ref_id >= checkpoint.next_ref_id)
                entry.ref_id.reset();
        m_next_ref_id = checkpoint.next_ref_id;
    }

  private:
    struct Entry
    {
        Value keep_alive;
        String canonical_path;
        std::optional<RefId> ref_id;
    };

    bool m_enabled;
    std::unordered_map<const void*, Entry> m_entries;
    std::vector<const void*> m_order;
    RefId m_next_ref_id = 1;
};

} // namespace stash
