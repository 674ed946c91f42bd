/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/core/Value.hxx>
#include <stash/support/Ref.hxx>

#include <optional>

namespace stash {

enum class ContainerKind
{
    SCALAR,     // no children
    SEQUENCE,   // children addressed by integer index
    MAPPING,    // children addressed by string key
    OBJECT      // user-defined object, children are the fields of its state
};

/////////////////////////////////////////////////////////////////////////////
/// The stored form of one value.
/// - `inline_value` is a JSON representable value stored in the metadata
///   index, or empty.
/// - `payload` is stored in a separate member of the container, whose name
///   ends with `extension`.
/// - For container kinds, `children` is a list (SEQUENCE) or map (MAPPING,
///   OBJECT).  When encoding, the children are the values still to be
///   encoded.  When decoding, they are the already decoded children.
/////////////////////////////////////////////////////////////////////////////
struct Encoding
{
    ContainerKind kind = ContainerKind::SCALAR;
    Value inline_value;
    std::optional<Bytes> payload;
    String extension = "bin";
    Value children;
};

/////////////////////////////////////////////////////////////////////////////
/// Encoder/decoder pair for one type tag.
/// - Codecs are shared between registries and must be stateless, or
///   thread-safe.
/////////////////////////////////////////////////////////////////////////////
class Codec
{
  public:
    virtual ~Codec() = default;

    /// @throws StashException if the value cannot be encoded.
    virtual Encoding encode(const Value& value) const = 0;

    /// @throws StashException if the encoding is malformed.
    virtual Value decode(const Encoding& encoding) const = 0;

  private:
    refcnt_t m_ref_count = 0;

  template <typename> friend class ::stash::Ref;
};

} // namespace stash
