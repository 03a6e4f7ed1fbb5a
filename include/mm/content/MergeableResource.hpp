#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "mm/content/ActorInfo.hpp"
#include "mm/content/ActorLink.hpp"
#include "mm/content/AreaData.hpp"
#include "mm/content/AttClientList.hpp"
#include "mm/content/DropTable.hpp"
#include "mm/content/GameData.hpp"
#include "mm/content/GeneralParamList.hpp"
#include "mm/content/GenericResources.hpp"
#include "mm/content/MainFieldStatic.hpp"
#include "mm/content/ResidentActors.hpp"
#include "mm/core/Endian.hpp"

namespace mm::content {

/**
 * @brief Closed sum of every resource kind with diff/merge semantics.
 *
 * Diff() and Merge() dispatch to the kind's own rules when both operands hold
 * the same kind. Pairing two different kinds is a caller bug and raises
 * core::SchemaMismatchError.
 */
class MergeableResource {
public:
    using Variant = std::variant<ActorLink,
                                 AttClientList,
                                 DropTable,
                                 GeneralParamList,
                                 ActorInfo,
                                 AreaData,
                                 ResidentActors,
                                 MainFieldStatic,
                                 GameDataPack,
                                 GenericParameters,
                                 GenericDocument>;

    template <typename T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, MergeableResource> &&
                                          std::is_constructible_v<Variant, T&&>>>
    MergeableResource(T&& resource) : m_resource(std::forward<T>(resource)) {}

    std::string_view KindName() const;

    MergeableResource Diff(const MergeableResource& modified) const;
    MergeableResource Merge(const MergeableResource& diff) const;

    // Parameter archive kinds are little endian on every platform.
    core::Endian OutputEndian(core::Endian target) const;
    std::vector<std::uint8_t> ToBinary(core::Endian endian) const;

    template <typename T>
    const T* As() const {
        return std::get_if<T>(&m_resource);
    }

    const Variant& Value() const { return m_resource; }

    bool operator==(const MergeableResource&) const = default;

private:
    Variant m_resource;
};

} // namespace mm::content
