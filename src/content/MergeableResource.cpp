#include "mm/content/MergeableResource.hpp"

#include "mm/core/Error.hpp"
#include "mm/core/Logger.hpp"

namespace mm::content {

namespace {

// Kinds whose ToBinary() takes no byte order are parameter archives.
template <typename T>
constexpr bool kIsParameterArchive =
    std::is_invocable_r_v<std::vector<std::uint8_t>, decltype(&T::ToBinary), const T&>;

template <typename Op>
MergeableResource Combine(std::string_view operation,
                          const MergeableResource& lhs,
                          const MergeableResource& rhs,
                          Op op) {
    return std::visit(
        [&](const auto& a, const auto& b) -> MergeableResource {
            using A = std::decay_t<decltype(a)>;
            using B = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<A, B>) {
                return MergeableResource(op(a, b));
            } else {
                core::Logger::Error("[MergeableResource] Tried to {} incompatible resources: {} and {}",
                                    operation, A::kKindName, B::kKindName);
                throw core::SchemaMismatchError(operation, A::kKindName, B::kKindName);
            }
        },
        lhs.Value(), rhs.Value());
}

} // namespace

std::string_view MergeableResource::KindName() const {
    return std::visit([](const auto& resource) { return std::decay_t<decltype(resource)>::kKindName; },
                      m_resource);
}

MergeableResource MergeableResource::Diff(const MergeableResource& modified) const {
    return Combine("diff", *this, modified, [](const auto& base, const auto& other) { return base.Diff(other); });
}

MergeableResource MergeableResource::Merge(const MergeableResource& diff) const {
    return Combine("merge", *this, diff, [](const auto& base, const auto& other) { return base.Merge(other); });
}

core::Endian MergeableResource::OutputEndian(core::Endian target) const {
    return std::visit(
        [target](const auto& resource) {
            using T = std::decay_t<decltype(resource)>;
            return kIsParameterArchive<T> ? core::Endian::Little : target;
        },
        m_resource);
}

std::vector<std::uint8_t> MergeableResource::ToBinary(core::Endian endian) const {
    return std::visit(
        [endian](const auto& resource) {
            using T = std::decay_t<decltype(resource)>;
            if constexpr (kIsParameterArchive<T>) {
                return resource.ToBinary();
            } else {
                return resource.ToBinary(endian);
            }
        },
        m_resource);
}

} // namespace mm::content
