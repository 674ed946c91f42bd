/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/Codec.hxx>
#include <stash/archive/codecs.hxx>
#include <stash/archive/errors.hxx>
#include <stash/support/Ref.hxx>

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace stash {

/////////////////////////////////////////////////////////////////////////////
/// Maps runtime types to type tags and codecs, and type tags to codecs.
/// - Encoding resolves the exact runtime type of a value first.  Values
///   whose type has no exact registration are offered to the fallbacks, in
///   the order they were added.  A fallback stores the value under its own
///   type tag, so the exact type is not restored on read.
/// - Decoding resolves the type tag recorded in the archive.
/// - Archive sessions hold a private copy of a registry, so registrations
///   made after a session opens do not affect it.
/////////////////////////////////////////////////////////////////////////////
class TypeRegistry
{
  public:
    using Predicate = std::function<bool(const Value&)>;

    struct Resolved
    {
        String type_tag;
        Ref<Codec> r_codec;
    };

    TypeRegistry() = default;
    TypeRegistry(const TypeRegistry& other)
      : m_exact{other.m_exact}
      , m_decoders{other.m_decoders}
      , m_fallbacks{other.m_fallbacks}
    {}

    TypeRegistry& operator = (const TypeRegistry&) = delete;

    /// Register a codec for values whose runtime type is exactly `type`.
    void add(const String& type_tag, std::type_index type, const Ref<Codec>& r_codec) {
        m_exact.insert_or_assign(type, Resolved{type_tag, r_codec});
        m_decoders.insert_or_assign(type_tag, r_codec);
    }

    template <class T>
    void add(const String& type_tag, const Ref<Codec>& r_codec) {
        add(type_tag, typeid(T), r_codec);
    }

    /// Register a user-defined Stateful type.
    template <class T>
    void add_stateful(const String& type_tag) {
        add<T>(type_tag, new codecs::StatefulCodec<T>());
    }

    /// Register a structural fallback, consulted in order when a value has
    /// no exact registration.
    void add_fallback(const String& type_tag, Predicate&& predicate, const Ref<Codec>& r_codec) {
        m_fallbacks.push_back(Fallback{type_tag, std::forward<Predicate>(predicate), r_codec});
        m_decoders.insert_or_assign(type_tag, r_codec);
    }

    /// Register a decoder only, for example to read archives written with a
    /// type tag that is no longer produced.
    void add_decoder(const String& type_tag, const Ref<Codec>& r_codec) {
        m_decoders.insert_or_assign(type_tag, r_codec);
    }

    /// Remove all registrations of a type tag.
    void remove(const String& type_tag) {
        m_decoders.erase(type_tag);
        std::erase_if(m_exact, [&type_tag] (const auto& item) { return item.second.type_tag == type_tag; });
        std::erase_if(m_fallbacks, [&type_tag] (const auto& fallback) { return fallback.type_tag == type_tag; });
    }

    bool has_type_tag(const String& type_tag) const { return m_decoders.find(type_tag) != m_decoders.end(); }
    bool is_empty() const { return m_decoders.size() == 0; }

    /// @param path The location of the value, for error reporting.
    /// @throws UnsupportedTypeError if neither an exact registration nor a
    /// fallback accepts the value.
    Resolved resolve_for_encode(const Value& value, const Path& path) const {
        auto it = m_exact.find(value.runtime_type());
        if (it != m_exact.end()) return it->second;

        for (auto& fallback : m_fallbacks)
            if (fallback.predicate(value))
                return {fallback.type_tag, fallback.r_codec};

        throw UnsupportedTypeError(path, type_name(value));
    }

    /// @param path The location of the node, for error reporting.
    /// @throws UnknownTypeTagError if the type tag is not registered.
    Ref<Codec> resolve_for_decode(const String& type_tag, const Path& path) const {
        auto it = m_decoders.find(type_tag);
        if (it == m_decoders.end()) throw UnknownTypeTagError(path, type_tag);
        return it->second;
    }

    static String type_name(const Value& value) {
        if (value.type() == Value::OPAQUE) return value.runtime_type().name();
        return String{value.type_name()};
    }

  private:
    struct Fallback
    {
        String type_tag;
        Predicate predicate;
        Ref<Codec> r_codec;
    };

    std::unordered_map<std::type_index, Resolved> m_exact;
    std::unordered_map<String, Ref<Codec>> m_decoders;
    std::vector<Fallback> m_fallbacks;
    refcnt_t m_ref_count = 0;

  template <typename> friend class ::stash::Ref;
};

/// Register the built-in scalar and container types.
inline
void add_builtin_types(TypeRegistry& registry) {
    registry.add<nil_t>("none", new codecs::NilCodec());
    registry.add<bool>("bool", new codecs::BoolCodec());
    registry.add<Int>("int", new codecs::IntCodec());
    registry.add<UInt>("uint", new codecs::UIntCodec());
    registry.add<Float>("float", new codecs::FloatCodec());
    registry.add<String>("str", new codecs::StrCodec());
    registry.add<Bytes>("bytes", new codecs::BytesCodec());
    registry.add<List>("list", new codecs::ListCodec());
    registry.add<Map>("dict", new codecs::MapCodec());

    registry.add_fallback("list", [] (const Value& value) { return value.as_opaque<SequenceLike>() != nullptr; },
                          new codecs::SequenceLikeCodec());

    registry.add_fallback("dict", [] (const Value& value) { return value.as_opaque<MappingLike>() != nullptr; },
                          new codecs::MappingLikeCodec());
}

namespace impl {

/////////////////////////////////////////////////////////////////////////////
/// Default registry initialization macro.
/// - `init_default_registry` is defined by the macro so that it may register
///   the adapter types declared by headers included before the macro.
/// - See STASH_INIT in stash/stash.hxx.
/////////////////////////////////////////////////////////////////////////////
#define STASH_INIT_REGISTRY namespace stash::impl { \
    std::mutex default_registry_mutex; \
    TypeRegistry default_registry; \
    void init_default_registry() { \
        add_builtin_types(default_registry); \
        add_adapter_types(default_registry); \
    } \
}

extern std::mutex default_registry_mutex;
extern TypeRegistry default_registry;

void init_default_registry();

} // namespace impl

/////////////////////////////////////////////////////////////////////////////
/// Returns a snapshot of the process-wide default registry.
/// - The snapshot is not affected by later changes to the default registry.
/////////////////////////////////////////////////////////////////////////////
inline
Ref<TypeRegistry> default_registry() {
    std::scoped_lock lock{impl::default_registry_mutex};
    if (impl::default_registry.is_empty()) impl::init_default_registry();
    return new TypeRegistry{impl::default_registry};
}

/////////////////////////////////////////////////////////////////////////////
/// Modify the process-wide default registry.
/// @param func A function accepting a `TypeRegistry&`.
/// - Registration is expected to happen once, during program start-up.
/////////////////////////////////////////////////////////////////////////////
template <typename Func>
void update_default_registry(Func&& func) {
    std::scoped_lock lock{impl::default_registry_mutex};
    if (impl::default_registry.is_empty()) impl::init_default_registry();
    func(impl::default_registry);
}

/// Register a user-defined Stateful type in the default registry.
template <class T>
void register_stateful(const String& type_tag) {
    update_default_registry([&type_tag] (TypeRegistry& registry) { registry.add_stateful<T>(type_tag); });
}

} // namespace stash
