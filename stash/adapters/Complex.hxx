/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/codecs.hxx>

#include <fmt/format.h>

#include <complex>

namespace stash {

/// A complex number held by a Value.
class Complex : public Opaque
{
  public:
    Complex() = default;
    Complex(Float real, Float imag) : m_value{real, imag} {}
    Complex(const std::complex<Float>& value) : m_value{value} {}

    Float real() const { return m_value.real(); }
    Float imag() const { return m_value.imag(); }
    const std::complex<Float>& value() const { return m_value; }

    Opaque* clone() const override { return new Complex{m_value}; }

    String str() const override {
        return fmt::format("({}{}{}j)", float_to_str(real()), imag() < 0? "": "+", float_to_str(imag()));
    }

    bool equals(const Opaque& other) const override {
        auto p_other = dynamic_cast<const Complex*>(&other);
        return p_other != nullptr && p_other->m_value == m_value;
    }

  private:
    std::complex<Float> m_value;
};

namespace codecs {

/// Stored inline as `{"real": r, "imag": i}`.
class ComplexCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override {
        auto& number = value.as<Complex>();
        Map json;
        json.insert({"real", number.real()});
        json.insert({"imag", number.imag()});
        return {.inline_value = json};
    }

    Value decode(const Encoding& encoding) const override {
        require_inline(encoding, "complex");
        auto& json = encoding.inline_value;
        if (json.type() != Value::MAP) throw WrongType{json.type_name(), "map"};
        return Value::make<Complex>(json.get("real").to_float(), json.get("imag").to_float());
    }
};

} // namespace codecs
} // namespace stash
