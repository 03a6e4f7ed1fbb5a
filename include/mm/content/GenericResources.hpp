#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "mm/content/BymlMerge.hpp"
#include "mm/content/ParameterMerge.hpp"
#include "mm/core/Endian.hpp"
#include "mm/formats/Aamp.hpp"
#include "mm/formats/Byml.hpp"

namespace mm::content {

// Any parameter archive without a dedicated schema, merged object- and list-wise.
class GenericParameters {
public:
    static constexpr std::string_view kKindName = "GenericParameters";

    GenericParameters() = default;
    explicit GenericParameters(formats::aamp::ParameterIO pio) : m_pio(std::move(pio)) {}

    static GenericParameters FromBinary(std::span<const std::uint8_t> data);
    std::vector<std::uint8_t> ToBinary() const { return m_pio.ToBinary(); }

    GenericParameters Diff(const GenericParameters& modified) const;
    GenericParameters Merge(const GenericParameters& diff) const;

    const formats::aamp::ParameterIO& Document() const { return m_pio; }

    bool operator==(const GenericParameters&) const = default;

private:
    formats::aamp::ParameterIO m_pio;
};

// Any BYML document without a dedicated schema, merged key-wise.
class GenericDocument {
public:
    static constexpr std::string_view kKindName = "GenericDocument";

    GenericDocument() = default;
    explicit GenericDocument(formats::Byml root) : m_root(std::move(root)) {}

    static GenericDocument FromBinary(std::span<const std::uint8_t> data);
    std::vector<std::uint8_t> ToBinary(core::Endian endian) const { return m_root.ToBinary(endian); }

    GenericDocument Diff(const GenericDocument& modified) const;
    GenericDocument Merge(const GenericDocument& diff) const;

    const formats::Byml& Root() const { return m_root; }

    bool operator==(const GenericDocument&) const = default;

private:
    formats::Byml m_root;
};

} // namespace mm::content
