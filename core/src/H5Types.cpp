#include "h5cx/core/h5/H5Types.hpp"

#include "h5cx/core/util/Errors.hpp"

namespace h5cx::h5
{

hid_t nativeType(PrimitiveType type)
{
    switch (type) {
        case PrimitiveType::Int8:    return H5T_NATIVE_INT8;
        case PrimitiveType::Int16:   return H5T_NATIVE_INT16;
        case PrimitiveType::Int32:   return H5T_NATIVE_INT32;
        case PrimitiveType::Int64:   return H5T_NATIVE_INT64;
        case PrimitiveType::UInt8:   return H5T_NATIVE_UINT8;
        case PrimitiveType::UInt16:  return H5T_NATIVE_UINT16;
        case PrimitiveType::UInt32:  return H5T_NATIVE_UINT32;
        case PrimitiveType::UInt64:  return H5T_NATIVE_UINT64;
        case PrimitiveType::Float32: return H5T_NATIVE_FLOAT;
        case PrimitiveType::Float64: return H5T_NATIVE_DOUBLE;
        default: break;
    }
    throw StorageError("no native HDF5 type for " + toString(type));
}

hid_t storageType(PrimitiveType type)
{
    switch (type) {
        case PrimitiveType::Int8:    return H5T_STD_I8LE;
        case PrimitiveType::Int16:   return H5T_STD_I16LE;
        case PrimitiveType::Int32:   return H5T_STD_I32LE;
        case PrimitiveType::Int64:   return H5T_STD_I64LE;
        case PrimitiveType::UInt8:   return H5T_STD_U8LE;
        case PrimitiveType::UInt16:  return H5T_STD_U16LE;
        case PrimitiveType::UInt32:  return H5T_STD_U32LE;
        case PrimitiveType::UInt64:  return H5T_STD_U64LE;
        case PrimitiveType::Float32: return H5T_IEEE_F32LE;
        case PrimitiveType::Float64: return H5T_IEEE_F64LE;
        default: break;
    }
    throw StorageError("no storage HDF5 type for " + toString(type));
}

namespace
{

Handle stringType(const MemberLayout& m)
{
    auto type = own(H5Tcopy(H5T_C_S1), H5Tclose, "copy string type");
    check(H5Tset_size(type.get(), m.elementSize), "set string size of " + m.name());
    check(H5Tset_strpad(type.get(), H5T_STR_NULLTERM), "set string padding of " + m.name());
    return type;
}

// Enum ordinals are inserted in native byte order for both variants.
Handle enumType(const MemberLayout& m)
{
    const auto& values = m.spec.enumType->values();
    const std::size_t width = m.elementSize;
    hid_t base = width == 1 ? H5T_NATIVE_INT8 : width == 2 ? H5T_NATIVE_INT16 : H5T_NATIVE_INT32;

    auto type = own(H5Tenum_create(base), H5Tclose, "create enum type for " + m.name());
    for (std::size_t i = 0; i < values.size(); ++i) {
        herr_t status;
        if (width == 1) {
            auto v = static_cast<std::int8_t>(i);
            status = H5Tenum_insert(type.get(), values[i].c_str(), &v);
        } else if (width == 2) {
            auto v = static_cast<std::int16_t>(i);
            status = H5Tenum_insert(type.get(), values[i].c_str(), &v);
        } else {
            auto v = static_cast<std::int32_t>(i);
            status = H5Tenum_insert(type.get(), values[i].c_str(), &v);
        }
        check(status, "insert enum value '" + values[i] + "'");
    }
    return type;
}

// FALSE/TRUE over a one byte integer
Handle booleanType()
{
    auto type = own(H5Tenum_create(H5T_NATIVE_INT8), H5Tclose, "create boolean type");
    const std::int8_t no = 0;
    const std::int8_t yes = 1;
    check(H5Tenum_insert(type.get(), "FALSE", &no), "insert boolean value FALSE");
    check(H5Tenum_insert(type.get(), "TRUE", &yes), "insert boolean value TRUE");
    return type;
}

Handle elementType(const MemberLayout& m, bool native)
{
    switch (m.spec.primitive) {
        case PrimitiveType::Bool:
            return booleanType();
        case PrimitiveType::String:
            return stringType(m);
        case PrimitiveType::Enum:
            return enumType(m);
        case PrimitiveType::Compound:
            return makeCompoundType(*m.nested, native);
        default: {
            hid_t base = native ? nativeType(m.spec.primitive) : storageType(m.spec.primitive);
            return own(H5Tcopy(base), H5Tclose, "copy type of " + m.name());
        }
    }
}

Handle memberType(const MemberLayout& m, bool native)
{
    auto element = elementType(m, native);
    if (m.dimensions.empty()) {
        return element;
    }
    std::vector<hsize_t> dims(m.dimensions.begin(), m.dimensions.end());
    return own(
        H5Tarray_create2(element.get(), static_cast<unsigned>(dims.size()), dims.data()),
        H5Tclose, "create array type of " + m.name());
}

}  // namespace

Handle makeCompoundType(const RecordLayout& layout, bool native)
{
    if (layout.totalLength() == 0) {
        throw StorageError("cannot build an HDF5 compound type of zero bytes");
    }
    auto type = own(
        H5Tcreate(H5T_COMPOUND, layout.totalLength()), H5Tclose, "create compound type");
    for (const auto& m : layout.members()) {
        if (m.length == 0) {
            continue;
        }
        auto mt = memberType(m, native);
        check(
            H5Tinsert(type.get(), m.name().c_str(), m.offset, mt.get()),
            "insert member '" + m.name() + "'");
    }
    return type;
}

std::string typeClassName(H5T_class_t cls)
{
    switch (cls) {
        case H5T_INTEGER:  return "integer";
        case H5T_FLOAT:    return "float";
        case H5T_STRING:   return "string";
        case H5T_ENUM:     return "enum";
        case H5T_COMPOUND: return "compound";
        case H5T_ARRAY:    return "array";
        case H5T_BITFIELD: return "bitfield";
        case H5T_OPAQUE:   return "opaque";
        case H5T_REFERENCE: return "reference";
        case H5T_VLEN:     return "vlen";
        case H5T_TIME:     return "time";
        default:           return "unknown";
    }
}

std::vector<CommittedMember> inspectCompoundType(hid_t type)
{
    if (H5Tget_class(type) != H5T_COMPOUND) {
        throw StorageError("HDF5 type is not a compound type");
    }
    int n = H5Tget_nmembers(type);
    check(n, "count compound members");

    std::vector<CommittedMember> members;
    for (unsigned i = 0; i < static_cast<unsigned>(n); ++i) {
        CommittedMember cm;

        char* name = H5Tget_member_name(type, i);
        if (!name) {
            throw StorageError("HDF5: read name of compound member " + std::to_string(i) + errorStack());
        }
        cm.name = name;
        check(H5free_memory(name), "free member name");

        cm.offset = H5Tget_member_offset(type, i);
        auto mt = own(H5Tget_member_type(type, i), H5Tclose, "read type of member " + cm.name);
        cm.size = H5Tget_size(mt.get());
        auto cls = H5Tget_class(mt.get());
        cm.typeClass = typeClassName(cls);

        if (cls == H5T_ARRAY) {
            int rank = H5Tget_array_ndims(mt.get());
            check(rank, "read array rank of " + cm.name);
            std::vector<hsize_t> dims(static_cast<std::size_t>(rank));
            check(H5Tget_array_dims2(mt.get(), dims.data()), "read array dims of " + cm.name);
            cm.dimensions.assign(dims.begin(), dims.end());
            auto base = own(H5Tget_super(mt.get()), H5Tclose, "read element type of " + cm.name);
            cm.elementClass = typeClassName(H5Tget_class(base.get()));
        }
        members.push_back(std::move(cm));
    }
    return members;
}

}  // namespace h5cx::h5
