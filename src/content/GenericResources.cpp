#include "mm/content/GenericResources.hpp"

namespace mm::content {

GenericParameters GenericParameters::FromBinary(std::span<const std::uint8_t> data) {
    return GenericParameters(formats::aamp::ParameterIO::FromBinary(data, kKindName));
}

GenericParameters GenericParameters::Diff(const GenericParameters& modified) const {
    formats::aamp::ParameterIO diff;
    diff.version = modified.m_pio.version;
    diff.type = modified.m_pio.type;
    diff.root = DiffList(m_pio.root, modified.m_pio.root);
    return GenericParameters(std::move(diff));
}

GenericParameters GenericParameters::Merge(const GenericParameters& diff) const {
    formats::aamp::ParameterIO merged;
    merged.version = diff.m_pio.version;
    merged.type = diff.m_pio.type;
    merged.root = MergeList(m_pio.root, diff.m_pio.root);
    return GenericParameters(std::move(merged));
}

GenericDocument GenericDocument::FromBinary(std::span<const std::uint8_t> data) {
    return GenericDocument(formats::Byml::FromBinary(data, kKindName));
}

GenericDocument GenericDocument::Diff(const GenericDocument& modified) const {
    return GenericDocument(DiffDocument(m_root, modified.m_root));
}

GenericDocument GenericDocument::Merge(const GenericDocument& diff) const {
    return GenericDocument(MergeDocument(m_root, diff.m_root));
}

} // namespace mm::content
