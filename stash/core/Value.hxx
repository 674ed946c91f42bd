/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
/** @file */
#pragma once

#include <stash/core/Path.hxx>
#include <stash/support/types.hxx>
#include <stash/support/integer.hxx>
#include <stash/support/string.hxx>
#include <stash/support/exception.hxx>

#include <tsl/ordered_map.h>

#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <typeindex>
#include <typeinfo>

namespace stash {

class Value;
class Opaque;

using List = std::vector<Value>;
using Map = tsl::ordered_map<String, Value>;
using OpaquePtr = Opaque*;

/////////////////////////////////////////////////////////////////////////////
/// Heap storage for reference counted representations.
/////////////////////////////////////////////////////////////////////////////
template <typename T>
struct Box
{
    template <typename Arg>
    Box(Arg&& arg) : data(std::forward<Arg>(arg)) {}

    T data;
    refcnt_t ref_count = 1;
};

/////////////////////////////////////////////////////////////////////////////
/// Dynamic value, the in-memory form of everything an archive stores.
/// - Like Python objects, a Value is a reference to its backing data.  The
///   assignment operator copies the reference, not the data.  Use
///   @ref copy to make a deep copy.
/// - The NIL, BOOL, INT, UINT and FLOAT representations are stored in the
///   Value by-value.  STR, BYTES, LIST, MAP and OPAQUE are heap allocated
///   and reference counted.
/// - Two Values refer to the same object when @ref is returns true.  The
///   address returned by @ref id is the identity key used to detect shared
///   containers when writing an archive.
/// - Reference counts are not atomic.
/////////////////////////////////////////////////////////////////////////////
class Value
{
  public:
    // Enumeration representing the type of the backing data.
    enum ReprIX {
        EMPTY,   // uninitialized reference
        NIL,     // json null
        BOOL,
        INT,
        UINT,
        FLOAT,
        STR,
        BYTES,
        LIST,
        MAP,     // insertion ordered map
        OPAQUE   // user-defined object
    };

  private:
    union Repr {
        Repr()                : z{nullptr} {}
        Repr(bool v)          : b{v} {}
        Repr(Int v)           : i{v} {}
        Repr(UInt v)          : u{v} {}
        Repr(Float v)         : f{v} {}
        Repr(Box<String>* p)  : ps{p} {}
        Repr(Box<Bytes>* p)   : pb{p} {}
        Repr(Box<List>* p)    : pl{p} {}
        Repr(Box<Map>* p)     : pm{p} {}
        Repr(OpaquePtr p)     : po{p} {}

        void*        z;
        bool         b;
        Int          i;
        UInt         u;
        Float        f;
        Box<String>* ps;
        Box<Bytes>*  pb;
        Box<List>*   pl;
        Box<Map>*    pm;
        OpaquePtr    po;
    };

  public:
    static std::string_view type_name(ReprIX repr_ix) {
        switch (repr_ix) {
            case EMPTY:  return "empty";
            case NIL:    return "nil";
            case BOOL:   return "bool";
            case INT:    return "int";
            case UINT:   return "uint";
            case FLOAT:  return "float";
            case STR:    return "str";
            case BYTES:  return "bytes";
            case LIST:   return "list";
            case MAP:    return "map";
            case OPAQUE: return "opaque";
            default:     throw std::logic_error("invalid repr_ix");
        }
    }

  public:
    Value()                       : m_repr{}, m_repr_ix{EMPTY} {}
    Value(nil_t)                  : m_repr{}, m_repr_ix{NIL} {}
    Value(is_bool auto v)         : m_repr{v}, m_repr_ix{BOOL} {}
    Value(is_like_Int auto v)     : m_repr{(Int)v}, m_repr_ix{INT} {}
    Value(is_like_UInt auto v)    : m_repr{(UInt)v}, m_repr_ix{UINT} {}
    Value(is_like_Float auto v)   : m_repr{(Float)v}, m_repr_ix{FLOAT} {}
    Value(const char* v)          : m_repr{new Box<String>(v)}, m_repr_ix{STR} {}
    Value(const StringView& v)    : m_repr{new Box<String>(String{v})}, m_repr_ix{STR} {}
    Value(const String& v)        : m_repr{new Box<String>(v)}, m_repr_ix{STR} {}
    Value(String&& v)             : m_repr{new Box<String>(std::forward<String>(v))}, m_repr_ix{STR} {}
    Value(const Bytes& v)         : m_repr{new Box<Bytes>(v)}, m_repr_ix{BYTES} {}
    Value(Bytes&& v)              : m_repr{new Box<Bytes>(std::forward<Bytes>(v))}, m_repr_ix{BYTES} {}
    Value(const List& v)          : m_repr{new Box<List>(v)}, m_repr_ix{LIST} {}
    Value(List&& v)               : m_repr{new Box<List>(std::forward<List>(v))}, m_repr_ix{LIST} {}
    Value(const Map& v)           : m_repr{new Box<Map>(v)}, m_repr_ix{MAP} {}
    Value(Map&& v)                : m_repr{new Box<Map>(std::forward<Map>(v))}, m_repr_ix{MAP} {}
    Value(std::unique_ptr<Opaque>&& p);
    Value(ReprIX repr_ix);

    Value(const Value& other);
    Value(Value&& other);

    ~Value() { dec_ref_count(); }

    Value& operator = (const Value& other);
    Value& operator = (Value&& other);

    /// Construct a user-defined object in place.
    template <class T, typename... Args>
    static Value make(Args&&... args) {
        return Value{std::unique_ptr<Opaque>{new T(std::forward<Args>(args)...)}};
    }

    ReprIX type() const { return m_repr_ix; }
    std::string_view type_name() const;

    bool is_empty() const     { return m_repr_ix == EMPTY; }
    bool is_nil() const       { return m_repr_ix == NIL; }
    bool is_number() const    { return m_repr_ix == INT || m_repr_ix == UINT || m_repr_ix == FLOAT; }
    bool is_container() const { return m_repr_ix == LIST || m_repr_ix == MAP; }

    /// Returns true if the representation is allocated on the heap, and
    /// therefore may be shared by more than one reference.
    bool is_shared_type() const { return m_repr_ix >= STR; }

    template <typename T> T& as();
    template <typename T> const T& as() const;

    /// Returns a pointer to the user-defined object, if it is a `T`.
    template <class T> T* as_opaque() const;

    Int to_int() const;
    Float to_float() const;

    /// Returns a text representation intended for diagnostics.
    String to_str() const;

    std::type_index runtime_type() const;

    const void* id() const;
    bool is(const Value& other) const;
    Value copy() const;
    refcnt_t ref_count() const;

    size_t size() const;
    Value get(const Key& key) const;
    Value lookup(const Path& path) const;
    void set(const Key& key, const Value& value);
    void append(const Value& value);
    bool contains(const String& key) const;
    std::vector<String> keys() const;

    Value& operator [] (size_t index);
    Value& operator [] (const String& key);

    bool operator == (const Value& other) const;
    bool operator == (nil_t) const { return m_repr_ix == NIL; }

  private:
    WrongType wrong_type() const { return WrongType{type_name()}; }
    WrongType wrong_type(std::string_view expected) const { return WrongType{type_name(), expected}; }

    void inc_ref_count() const;
    void dec_ref_count() const;
    void take(const Value& other);

  private:
    Repr m_repr;
    ReprIX m_repr_ix;
};

/////////////////////////////////////////////////////////////////////////////
/// Base class of user-defined objects held by a Value.
/////////////////////////////////////////////////////////////////////////////
class Opaque
{
  public:
    virtual ~Opaque() = default;
    virtual Opaque* clone() const = 0;
    virtual String str() const = 0;

    virtual bool equals(const Opaque& other) const { return this == &other; }

  private:
    refcnt_t m_ref_count = 0;

  friend class Value;
};

/////////////////////////////////////////////////////////////////////////////
/// A user-defined object exposing its externalizable state.
/// - `get_state` returns a map whose entries are stored as the object's
///   children, so each entry may be any value the archive can store.
/// - `set_state` is called on an instance constructed by its default
///   constructor.
/////////////////////////////////////////////////////////////////////////////
class Stateful : public Opaque
{
  public:
    virtual Value get_state() const = 0;
    virtual void set_state(const Value& state) = 0;

    bool equals(const Opaque& other) const override {
        if (typeid(*this) != typeid(other)) return false;
        return get_state() == static_cast<const Stateful&>(other).get_state();
    }
};

/// A user-defined object that may be stored as a plain list.
class SequenceLike : public Opaque
{
  public:
    virtual List to_list() const = 0;
};

/// A user-defined object that may be stored as a plain map.
class MappingLike : public Opaque
{
  public:
    virtual Map to_map() const = 0;
};

//----------------------------------------------------------------------------------
// Implementation
//----------------------------------------------------------------------------------

inline
Value::Value(std::unique_ptr<Opaque>&& p) : m_repr{p.release()}, m_repr_ix{OPAQUE} {
    if (m_repr.po == nullptr) throw StashException{"Null opaque object"};
    m_repr.po->m_ref_count = 1;
}

inline
Value::Value(ReprIX repr_ix) : m_repr{}, m_repr_ix{repr_ix} {
    switch (repr_ix) {
        case EMPTY: break;
        case NIL:   break;
        case BOOL:  m_repr.b = false; break;
        case INT:   m_repr.i = 0; break;
        case UINT:  m_repr.u = 0; break;
        case FLOAT: m_repr.f = 0; break;
        case STR:   m_repr.ps = new Box<String>(String{}); break;
        case BYTES: m_repr.pb = new Box<Bytes>(Bytes{}); break;
        case LIST:  m_repr.pl = new Box<List>(List{}); break;
        case MAP:   m_repr.pm = new Box<Map>(Map{}); break;
        default:
            m_repr_ix = EMPTY;
            throw WrongType{type_name(repr_ix)};
    }
}

inline
Value::Value(const Value& other) : m_repr_ix{other.m_repr_ix} {
    switch (m_repr_ix) {
        case EMPTY:  m_repr.z = nullptr; break;
        case NIL:    m_repr.z = nullptr; break;
        case BOOL:   m_repr.b = other.m_repr.b; break;
        case INT:    m_repr.i = other.m_repr.i; break;
        case UINT:   m_repr.u = other.m_repr.u; break;
        case FLOAT:  m_repr.f = other.m_repr.f; break;
        case STR:    m_repr.ps = other.m_repr.ps; inc_ref_count(); break;
        case BYTES:  m_repr.pb = other.m_repr.pb; inc_ref_count(); break;
        case LIST:   m_repr.pl = other.m_repr.pl; inc_ref_count(); break;
        case MAP:    m_repr.pm = other.m_repr.pm; inc_ref_count(); break;
        case OPAQUE: m_repr.po = other.m_repr.po; inc_ref_count(); break;
    }
}

inline
Value::Value(Value&& other) : m_repr_ix{other.m_repr_ix} {
    // generic memory copy
    m_repr.u = other.m_repr.u;
    other.m_repr_ix = EMPTY;
    other.m_repr.z = nullptr;
}

inline
Value& Value::operator = (const Value& other) {
    if (this == &other) return *this;
    Value save{*this};  // other may be owned by this
    dec_ref_count();
    take(other);
    return *this;
}

inline
Value& Value::operator = (Value&& other) {
    if (this == &other) return *this;
    Value save{*this};
    dec_ref_count();
    m_repr_ix = other.m_repr_ix;
    m_repr.u = other.m_repr.u;
    other.m_repr_ix = EMPTY;
    other.m_repr.z = nullptr;
    return *this;
}

inline
void Value::take(const Value& other) {
    m_repr_ix = other.m_repr_ix;
    m_repr.u = other.m_repr.u;
    inc_ref_count();
}

inline
void Value::inc_ref_count() const {
    switch (m_repr_ix) {
        case STR:    ++(m_repr.ps->ref_count); break;
        case BYTES:  ++(m_repr.pb->ref_count); break;
        case LIST:   ++(m_repr.pl->ref_count); break;
        case MAP:    ++(m_repr.pm->ref_count); break;
        case OPAQUE: ++(m_repr.po->m_ref_count); break;
        default:     break;
    }
}

inline
void Value::dec_ref_count() const {
    switch (m_repr_ix) {
        case STR:    if (--(m_repr.ps->ref_count) == 0) delete m_repr.ps; break;
        case BYTES:  if (--(m_repr.pb->ref_count) == 0) delete m_repr.pb; break;
        case LIST:   if (--(m_repr.pl->ref_count) == 0) delete m_repr.pl; break;
        case MAP:    if (--(m_repr.pm->ref_count) == 0) delete m_repr.pm; break;
        case OPAQUE: if (--(m_repr.po->m_ref_count) == 0) delete m_repr.po; break;
        default:     break;
    }
}

inline
std::string_view Value::type_name() const {
    return type_name(m_repr_ix);
}

template <typename T>
T& Value::as() {
    if constexpr (std::is_same<T, bool>::value) {
        if (m_repr_ix != BOOL) throw wrong_type("bool");
        return m_repr.b;
    } else if constexpr (std::is_same<T, Int>::value) {
        if (m_repr_ix != INT) throw wrong_type("int");
        return m_repr.i;
    } else if constexpr (std::is_same<T, UInt>::value) {
        if (m_repr_ix != UINT) throw wrong_type("uint");
        return m_repr.u;
    } else if constexpr (std::is_same<T, Float>::value) {
        if (m_repr_ix != FLOAT) throw wrong_type("float");
        return m_repr.f;
    } else if constexpr (std::is_same<T, String>::value) {
        if (m_repr_ix != STR) throw wrong_type("str");
        return m_repr.ps->data;
    } else if constexpr (std::is_same<T, Bytes>::value) {
        if (m_repr_ix != BYTES) throw wrong_type("bytes");
        return m_repr.pb->data;
    } else if constexpr (std::is_same<T, List>::value) {
        if (m_repr_ix != LIST) throw wrong_type("list");
        return m_repr.pl->data;
    } else if constexpr (std::is_same<T, Map>::value) {
        if (m_repr_ix != MAP) throw wrong_type("map");
        return m_repr.pm->data;
    } else {
        static_assert(std::is_base_of<Opaque, T>::value);
        auto p = as_opaque<T>();
        if (p == nullptr) throw wrong_type(typeid(T).name());
        return *p;
    }
}

template <typename T>
const T& Value::as() const {
    return const_cast<Value*>(this)->as<T>();
}

template <class T>
T* Value::as_opaque() const {
    if (m_repr_ix != OPAQUE) return nullptr;
    return dynamic_cast<T*>(m_repr.po);
}

inline
Int Value::to_int() const {
    switch (m_repr_ix) {
        case BOOL:  return m_repr.b;
        case INT:   return m_repr.i;
        case UINT:  return (Int)m_repr.u;
        case FLOAT: return (Int)m_repr.f;
        case STR:   return str_to_int(m_repr.ps->data);
        default:    throw wrong_type("int");
    }
}

inline
Float Value::to_float() const {
    switch (m_repr_ix) {
        case BOOL:  return m_repr.b;
        case INT:   return (Float)m_repr.i;
        case UINT:  return (Float)m_repr.u;
        case FLOAT: return m_repr.f;
        case STR:   return str_to_float(m_repr.ps->data);
        default:    throw wrong_type("float");
    }
}

inline
String Value::to_str() const {
    switch (m_repr_ix) {
        case EMPTY:  return "<empty>";
        case NIL:    return "nil";
        case BOOL:   return m_repr.b? "true": "false";
        case INT:    return int_to_str(m_repr.i);
        case UINT:   return int_to_str(m_repr.u);
        case FLOAT:  return float_to_str(m_repr.f);
        case STR:    return quoted(m_repr.ps->data);
        case BYTES:  return "<bytes size="s + int_to_str(m_repr.pb->data.size()) + ">";
        case LIST: {
            std::stringstream ss;
            ss << '[';
            bool first = true;
            for (auto& item : m_repr.pl->data) {
                if (!first) ss << ", ";
                ss << item.to_str();
                first = false;
            }
            ss << ']';
            return ss.str();
        }
        case MAP: {
            std::stringstream ss;
            ss << '{';
            bool first = true;
            for (auto& [key, item] : m_repr.pm->data) {
                if (!first) ss << ", ";
                ss << quoted(key) << ": " << item.to_str();
                first = false;
            }
            ss << '}';
            return ss.str();
        }
        case OPAQUE: return m_repr.po->str();
        default:     throw wrong_type();
    }
}

/// Marker type for runtime_type of an empty reference.
struct EmptyType {};

inline
std::type_index Value::runtime_type() const {
    switch (m_repr_ix) {
        case EMPTY:  return typeid(EmptyType);
        case NIL:    return typeid(nil_t);
        case BOOL:   return typeid(bool);
        case INT:    return typeid(Int);
        case UINT:   return typeid(UInt);
        case FLOAT:  return typeid(Float);
        case STR:    return typeid(String);
        case BYTES:  return typeid(Bytes);
        case LIST:   return typeid(List);
        case MAP:    return typeid(Map);
        case OPAQUE: return typeid(*m_repr.po);
        default:     throw wrong_type();
    }
}

inline
const void* Value::id() const {
    switch (m_repr_ix) {
        case STR:    return m_repr.ps;
        case BYTES:  return m_repr.pb;
        case LIST:   return m_repr.pl;
        case MAP:    return m_repr.pm;
        case OPAQUE: return m_repr.po;
        default:     return nullptr;
    }
}

inline
bool Value::is(const Value& other) const {
    if (other.m_repr_ix != m_repr_ix) return false;
    switch (m_repr_ix) {
        case EMPTY: return true;
        case NIL:   return true;
        case BOOL:  return m_repr.b == other.m_repr.b;
        case INT:   return m_repr.i == other.m_repr.i;
        case UINT:  return m_repr.u == other.m_repr.u;
        case FLOAT: return m_repr.f == other.m_repr.f;
        default:    return id() == other.id();
    }
}

inline
Value Value::copy() const {
    switch (m_repr_ix) {
        case STR:   return m_repr.ps->data;
        case BYTES: return m_repr.pb->data;
        case LIST: {
            List list;
            list.reserve(m_repr.pl->data.size());
            for (auto& item : m_repr.pl->data)
                list.push_back(item.copy());
            return list;
        }
        case MAP: {
            Map map;
            for (auto& [key, item] : m_repr.pm->data)
                map.insert({key, item.copy()});
            return map;
        }
        case OPAQUE: return std::unique_ptr<Opaque>{m_repr.po->clone()};
        default:     return *this;
    }
}

inline
refcnt_t Value::ref_count() const {
    switch (m_repr_ix) {
        case STR:    return m_repr.ps->ref_count;
        case BYTES:  return m_repr.pb->ref_count;
        case LIST:   return m_repr.pl->ref_count;
        case MAP:    return m_repr.pm->ref_count;
        case OPAQUE: return m_repr.po->m_ref_count;
        default:     return 0;
    }
}

inline
size_t Value::size() const {
    switch (m_repr_ix) {
        case STR:   return m_repr.ps->data.size();
        case BYTES: return m_repr.pb->data.size();
        case LIST:  return m_repr.pl->data.size();
        case MAP:   return m_repr.pm->data.size();
        default:    return 0;
    }
}

/// Returns nil if the key does not exist.
inline
Value Value::get(const Key& key) const {
    switch (m_repr_ix) {
        case LIST: {
            if (!key.is_index()) return nil;
            auto& list = m_repr.pl->data;
            Int index = key.index();
            if (index < 0) index += list.size();
            if (index < 0 || index >= (Int)list.size()) return nil;
            return list[index];
        }
        case MAP: {
            if (!key.is_name()) return nil;
            auto& map = m_repr.pm->data;
            auto it = map.find(key.name());
            if (it == map.end()) return nil;
            return it->second;
        }
        default:
            throw wrong_type("container");
    }
}

/// Returns nil if any step of the path does not exist.
inline
Value Value::lookup(const Path& path) const {
    Value value = *this;
    for (auto& key : path) {
        if (!value.is_container()) return nil;
        value = value.get(key);
    }
    return value;
}

inline
void Value::set(const Key& key, const Value& value) {
    switch (m_repr_ix) {
        case LIST: {
            auto& list = m_repr.pl->data;
            Int index = key.index();
            if (index < 0) index += list.size();
            if (index < 0 || index >= (Int)list.size()) throw StashException{"Index out of range: "s + key.to_str()};
            list[index] = value;
            break;
        }
        case MAP: {
            m_repr.pm->data.insert_or_assign(key.name(), value);
            break;
        }
        default:
            throw wrong_type("container");
    }
}

inline
void Value::append(const Value& value) {
    as<List>().push_back(value);
}

inline
bool Value::contains(const String& key) const {
    return as<Map>().count(key) != 0;
}

inline
std::vector<String> Value::keys() const {
    std::vector<String> keys;
    for (auto& [key, _] : as<Map>())
        keys.push_back(key);
    return keys;
}

inline
Value& Value::operator [] (size_t index) {
    auto& list = as<List>();
    if (index >= list.size()) throw StashException{"Index out of range: "s + int_to_str(index)};
    return list[index];
}

inline
Value& Value::operator [] (const String& key) {
    auto& map = as<Map>();
    auto it = map.find(key);
    if (it == map.end()) it = map.insert({key, Value{nil}}).first;
    return it.value();
}

inline
bool Value::operator == (const Value& other) const {
    if (is(other) && m_repr_ix != FLOAT) return true;

    switch (m_repr_ix) {
        case EMPTY: return other.m_repr_ix == EMPTY;
        case NIL:   return other.m_repr_ix == NIL;
        case BOOL:  return other.m_repr_ix == BOOL && m_repr.b == other.m_repr.b;
        case INT: {
            switch (other.m_repr_ix)
            {
                case INT:   return m_repr.i == other.m_repr.i;
                case UINT:  return equal(other.m_repr.u, m_repr.i);
                case FLOAT: return (Float)m_repr.i == other.m_repr.f;
                default:    return false;
            }
        }
        case UINT: {
            switch (other.m_repr_ix)
            {
                case INT:   return equal(m_repr.u, other.m_repr.i);
                case UINT:  return m_repr.u == other.m_repr.u;
                case FLOAT: return (Float)m_repr.u == other.m_repr.f;
                default:    return false;
            }
        }
        case FLOAT: {
            switch (other.m_repr_ix)
            {
                case INT:   return m_repr.f == (Float)other.m_repr.i;
                case UINT:  return m_repr.f == (Float)other.m_repr.u;
                case FLOAT: return m_repr.f == other.m_repr.f;
                default:    return false;
            }
        }
        case STR: {
            return other.m_repr_ix == STR && m_repr.ps->data == other.m_repr.ps->data;
        }
        case BYTES: {
            return other.m_repr_ix == BYTES && m_repr.pb->data == other.m_repr.pb->data;
        }
        case LIST: {
            if (other.m_repr_ix != LIST) return false;
            auto& lhs = m_repr.pl->data;
            auto& rhs = other.m_repr.pl->data;
            if (lhs.size() != rhs.size()) return false;
            for (List::size_type i=0; i<lhs.size(); i++)
                if (!(lhs[i] == rhs[i]))
                    return false;
            return true;
        }
        case MAP: {
            if (other.m_repr_ix != MAP) return false;
            auto& lhs = m_repr.pm->data;
            auto& rhs = other.m_repr.pm->data;
            if (lhs.size() != rhs.size()) return false;
            for (auto& [key, item] : lhs) {
                auto it = rhs.find(key);
                if (it == rhs.end() || !(item == it->second))
                    return false;
            }
            return true;
        }
        case OPAQUE: {
            return other.m_repr_ix == OPAQUE && m_repr.po->equals(*other.m_repr.po);
        }
        default:
            throw wrong_type();
    }
}

inline
std::ostream& operator << (std::ostream& os, const Value& value) {
    return os << value.to_str();
}

} // namespace stash
