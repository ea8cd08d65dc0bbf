#include "h5cx/core/compound/TypeRegistry.hpp"

#include "h5cx/core/util/Errors.hpp"
#include "h5cx/core/util/Logging.hpp"

#include <algorithm>

namespace h5cx
{

namespace
{

bool equalTypes(hid_t a, hid_t b)
{
    htri_t equal = H5Tequal(a, b);
    h5::check(equal, "compare compound types");
    return equal > 0;
}

bool linkExists(hid_t file, const std::string& path)
{
    htri_t exists = H5Lexists(file, path.c_str(), H5P_DEFAULT);
    h5::check(exists, "look up " + path);
    return exists > 0;
}

// one tag per member stored in the HDF5 type; empty when nothing is tagged
std::vector<TypeVariant> plannedTags(const RecordLayout& layout)
{
    const auto& members = layout.members();
    const bool tagged = std::any_of(members.begin(), members.end(), [](const MemberLayout& m) {
        return m.spec.variant != TypeVariant::None;
    });
    std::vector<TypeVariant> tags;
    if (!tagged) {
        return tags;
    }
    for (const auto& m : members) {
        if (m.length > 0) {
            tags.push_back(m.spec.variant);
        }
    }
    return tags;
}

}  // namespace

TypeRegistry::TypeRegistry(hid_t file, bool replaceConflictingTypes)
    : file_(file), replaceConflicting_(replaceConflictingTypes)
{
}

std::string TypeRegistry::committedPath(const std::string& name)
{
    return std::string(kTypeGroup) + "/Compound_" + name;
}

std::shared_ptr<const CompoundType> TypeRegistry::getOrCreate(
    const std::string& name, const RecordShape& shape, bool preferExisting)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto layout = planLayout(shape);
    auto storage = h5::makeCompoundType(*layout, false);
    auto native = h5::makeCompoundType(*layout, true);
    const auto path = committedPath(name);

    const auto tags = plannedTags(*layout);
    if (auto it = cache_.find(name); it != cache_.end() &&
        equalTypes(it->second->storageTypeId(), storage.get()) &&
        plannedTags(it->second->layout()) == tags) {
        Logger()->debug("reusing cached compound type {}", name);
        return it->second;
    }

    if (committedExists(path)) {
        auto existing = openCommitted(path);
        // variant tags are part of the type's identity
        const bool equal = equalTypes(existing.get(), storage.get()) &&
                           readVariantTags(existing.get()) == tags;

        if (equal || preferExisting) {
            if (!equal) {
                Logger()->warn(
                    "compound type {} differs from the committed type; using the committed "
                    "type because existing types are preferred",
                    name);
            } else {
                Logger()->debug("reusing committed compound type {}", name);
            }
            auto type = std::make_shared<CompoundType>(
                name, layout, std::move(existing), std::move(native));
            if (equal) {
                cache_[name] = type;
            }
            return type;
        }

        if (!replaceConflicting_) {
            throw TypeConflictError(
                "compound type '" + name + "' is already committed with a different layout");
        }

        Logger()->warn("replacing committed compound type {} with a different layout", name);
        cache_.erase(name);
        existing.close();
        h5::check(H5Ldelete(file_, path.c_str(), H5P_DEFAULT), "delete " + path);
        try {
            commit(path, storage.get(), *layout);
        } catch (const Error& e) {
            throw TypeConflictError(
                "compound type '" + name + "' was deleted but its replacement could not be " +
                "committed; the type is now absent: " + e.what());
        }
    } else {
        commit(path, storage.get(), *layout);
    }

    Logger()->info("committed compound type {} ({} bytes)", name, layout->totalLength());
    auto type = std::make_shared<CompoundType>(
        name, std::move(layout), std::move(storage), std::move(native));
    cache_[name] = type;
    return type;
}

bool TypeRegistry::contains(const std::string& name) const
{
    return committedExists(committedPath(name));
}

std::vector<h5::CommittedMember> TypeRegistry::describe(const std::string& name) const
{
    const auto path = committedPath(name);
    if (!committedExists(path)) {
        throw StorageError("no committed compound type '" + name + "'");
    }
    auto type = openCommitted(path);
    auto members = h5::inspectCompoundType(type.get());
    auto tags = readVariantTags(type.get());
    if (!tags.empty() && tags.size() != members.size()) {
        Logger()->warn(
            "compound type {} has {} variant tags for {} members; ignoring them",
            name, tags.size(), members.size());
        return members;
    }
    for (std::size_t i = 0; i < tags.size(); ++i) {
        members[i].variant = tags[i];
    }
    return members;
}

std::size_t TypeRegistry::commitCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return commitCount_;
}

void TypeRegistry::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

bool TypeRegistry::committedExists(const std::string& path) const
{
    return linkExists(file_, kTypeGroup) && linkExists(file_, path);
}

h5::Handle TypeRegistry::openCommitted(const std::string& path) const
{
    return h5::own(H5Topen2(file_, path.c_str(), H5P_DEFAULT), H5Tclose, "open " + path);
}

void TypeRegistry::commit(const std::string& path, hid_t type, const RecordLayout& layout)
{
    auto lcpl = h5::own(H5Pcreate(H5P_LINK_CREATE), H5Pclose, "create link property list");
    h5::check(H5Pset_create_intermediate_group(lcpl.get(), 1), "enable intermediate groups");
    h5::check(
        H5Tcommit2(file_, path.c_str(), type, lcpl.get(), H5P_DEFAULT, H5P_DEFAULT),
        "commit " + path);
    writeVariantTags(type, layout);
    ++commitCount_;
}

void TypeRegistry::writeVariantTags(hid_t type, const RecordLayout& layout) const
{
    const auto planned = plannedTags(layout);
    if (planned.empty()) {
        return;
    }
    std::vector<std::int8_t> tags;
    for (auto t : planned) {
        tags.push_back(static_cast<std::int8_t>(t));
    }

    hsize_t dims[1] = {tags.size()};
    auto space = h5::own(H5Screate_simple(1, dims, nullptr), H5Sclose, "create tag dataspace");
    auto attr = h5::own(
        H5Acreate2(type, kVariantAttribute, H5T_STD_I8LE, space.get(), H5P_DEFAULT, H5P_DEFAULT),
        H5Aclose, "create variant attribute");
    h5::check(H5Awrite(attr.get(), H5T_NATIVE_INT8, tags.data()), "write variant attribute");
}

std::vector<TypeVariant> TypeRegistry::readVariantTags(hid_t type) const
{
    htri_t exists = H5Aexists(type, kVariantAttribute);
    h5::check(exists, "look up variant attribute");
    if (exists == 0) {
        return {};
    }

    auto attr = h5::own(H5Aopen(type, kVariantAttribute, H5P_DEFAULT), H5Aclose, "open variant attribute");
    auto space = h5::own(H5Aget_space(attr.get()), H5Sclose, "read variant attribute dataspace");
    hssize_t n = H5Sget_simple_extent_npoints(space.get());
    if (n < 0) {
        throw StorageError("HDF5: count variant tags" + h5::errorStack());
    }

    std::vector<std::int8_t> raw(static_cast<std::size_t>(n));
    if (n > 0) {
        h5::check(H5Aread(attr.get(), H5T_NATIVE_INT8, raw.data()), "read variant attribute");
    }

    std::vector<TypeVariant> tags;
    tags.reserve(raw.size());
    for (auto t : raw) {
        tags.push_back(typeVariantFromOrdinal(t));
    }
    return tags;
}

}  // namespace h5cx
