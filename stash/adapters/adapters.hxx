/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/adapters/Complex.hxx>
#include <stash/adapters/NDArray.hxx>
#include <stash/adapters/Set.hxx>
#include <stash/adapters/Table.hxx>
#include <stash/adapters/Timestamp.hxx>
#include <stash/adapters/Tuple.hxx>
#include <stash/archive/Registry.hxx>

namespace stash {

/// Register the tuple, set, complex, datetime, array and table types.
inline
void add_adapter_types(TypeRegistry& registry) {
    registry.add<Tuple>("tuple", new codecs::TupleCodec());
    registry.add<Set>("set", new codecs::SetCodec());
    registry.add<Complex>("complex", new codecs::ComplexCodec());
    registry.add<Timestamp>("datetime", new codecs::TimestampCodec());
    registry.add<NDArray>("ndarray", new codecs::NDArrayCodec());
    registry.add<Table>("table", new codecs::TableCodec());
}

} // namespace stash
