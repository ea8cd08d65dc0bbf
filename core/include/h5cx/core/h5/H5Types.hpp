#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#include <hdf5.h>

#include "h5cx/core/compound/LayoutPlanner.hpp"
#include "h5cx/core/h5/Handle.hpp"
#include "h5cx/core/types/PrimitiveType.hpp"
#include "h5cx/core/types/TypeVariant.hpp"

namespace h5cx::h5
{

/** In-memory HDF5 type of a numeric primitive */
hid_t nativeType(PrimitiveType type);

/** Little-endian standard HDF5 type used on disk for a numeric primitive */
hid_t storageType(PrimitiveType type);

template <typename T>
hid_t nativeType()
{
    return nativeType(primitiveOf<T>());
}

template <typename T>
hid_t storageType()
{
    return storageType(primitiveOf<T>());
}

/**
 * @brief Build the HDF5 compound type of a record layout.
 *
 * Member offsets are the planned offsets. Members of zero bytes (arrays
 * with a zero extent) have no HDF5 counterpart and are left out.
 *
 * @param native true for the in-memory type, false for the on-disk type
 * @throws StorageError if HDF5 rejects the type, e.g. when every member is
 * empty
 */
Handle makeCompoundType(const RecordLayout& layout, bool native);

/** @brief One member of a committed compound type, as HDF5 reports it */
struct CommittedMember {
    std::string name;
    std::size_t offset = 0;
    std::size_t size = 0;
    /** "integer", "float", "string", "enum", "compound" or "array" */
    std::string typeClass;
    /** array extents, empty for non-array members */
    std::vector<std::uint64_t> dimensions;
    /** element class of array members */
    std::string elementClass;
    /** filled in from the type's variant attribute, if any */
    TypeVariant variant = TypeVariant::None;
};

/** @throws StorageError if the type is not a compound type */
std::vector<CommittedMember> inspectCompoundType(hid_t type);

/** Name of an HDF5 type class */
std::string typeClassName(H5T_class_t cls);

}  // namespace h5cx::h5
