#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <hdf5.h>

#include "h5cx/core/compound/CompoundType.hpp"
#include "h5cx/core/h5/H5Types.hpp"
#include "h5cx/core/types/RecordShape.hpp"

namespace h5cx
{

/**
 * @brief Creates, reuses and replaces the named compound types of one file.
 *
 * Types are committed as /__DATA_TYPES__/Compound_<name>. Members carrying
 * a type variant get their tags stored in the int8 attribute
 * __TYPE_VARIANT_MEMBERS__ of the committed type, one entry per stored
 * member.
 *
 * getOrCreate() is serialised by an internal mutex. The file identifier is
 * borrowed and must outlive the registry.
 */
class TypeRegistry
{
public:
    static constexpr const char* kTypeGroup = "/__DATA_TYPES__";
    static constexpr const char* kVariantAttribute = "__TYPE_VARIANT_MEMBERS__";

    explicit TypeRegistry(hid_t file, bool replaceConflictingTypes = true);

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    /**
     * @brief Get the compound type called name, committing it if needed.
     *
     * - not committed yet: the planned type is committed
     * - committed and preferExisting: the committed type is used as is; a
     *   warning is logged when it differs from the planned one
     * - committed, structurally equal and carrying the same variant tags:
     *   the committed type is reused
     * - committed and different, in layout or in variant tags: the committed
     *   type is deleted and the planned one committed, unless replacement is
     *   disabled
     *
     * @throws InvalidShapeError if the shape is malformed
     * @throws TypeConflictError if replacement is disabled or failed after
     * the old type was deleted
     * @throws StorageError on other HDF5 failures
     */
    std::shared_ptr<const CompoundType> getOrCreate(
        const std::string& name, const RecordShape& shape, bool preferExisting = false);

    /** True if a type of this name is committed in the file */
    bool contains(const std::string& name) const;

    /**
     * @brief Members of a committed type with their variant tags.
     * @throws StorageError if no such type is committed
     */
    std::vector<h5::CommittedMember> describe(const std::string& name) const;

    /** Number of types committed through this registry */
    std::size_t commitCount() const;

    /** Drop all cached types; their handles close once unreferenced */
    void clear();

    static std::string committedPath(const std::string& name);

private:
    bool committedExists(const std::string& path) const;
    h5::Handle openCommitted(const std::string& path) const;
    void commit(const std::string& path, hid_t type, const RecordLayout& layout);
    void writeVariantTags(hid_t type, const RecordLayout& layout) const;
    std::vector<TypeVariant> readVariantTags(hid_t type) const;

    hid_t file_;
    bool replaceConflicting_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const CompoundType>> cache_;
    std::size_t commitCount_ = 0;
};

}  // namespace h5cx
