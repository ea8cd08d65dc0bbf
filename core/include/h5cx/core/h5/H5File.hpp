#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <hdf5.h>

#include "h5cx/core/compound/CompoundType.hpp"
#include "h5cx/core/compound/TypeRegistry.hpp"
#include "h5cx/core/h5/H5Dataset.hpp"
#include "h5cx/core/h5/H5Types.hpp"
#include "h5cx/core/h5/Handle.hpp"
#include "h5cx/core/h5/SyncWorker.hpp"
#include "h5cx/core/types/RecordShape.hpp"
#include "h5cx/core/util/Config.hpp"

namespace h5cx
{

/**
 * @brief An HDF5 file with its compound type registry and sync policy.
 *
 * @code
 * auto file = H5File::create("out.h5", config);
 * auto type = file->compoundType("Sample", shape);
 * auto ds = file->createCompoundDataset("/samples", *type, {0}, {{1024}}, {{kUnlimited}});
 * ds.writeRecords(*type, type->mapCodec(), std::span<const MapRecord>(records));
 * file->close();
 * @endcode
 *
 * Not thread safe; use one H5File per thread or serialise access.
 */
class H5File
{
public:
    /**
     * @brief Create a new file.
     * @throws StorageError if the file exists and config.overwrite is false
     */
    static std::unique_ptr<H5File> create(
        const std::filesystem::path& path, const ContainerConfig& config = {});

    /** @brief Open an existing file for reading and writing */
    static std::unique_ptr<H5File> open(
        const std::filesystem::path& path, const ContainerConfig& config = {});

    /** @brief Open an existing file for reading; no sync worker is started */
    static std::unique_ptr<H5File> openReadOnly(
        const std::filesystem::path& path, const ContainerConfig& config = {});

    /** Closes the file; failures are logged */
    ~H5File();

    H5File(const H5File&) = delete;
    H5File& operator=(const H5File&) = delete;

    const std::filesystem::path& path() const { return path_; }
    const ContainerConfig& config() const { return config_; }
    bool isOpen() const { return file_.valid(); }
    bool isReadOnly() const { return readOnly_; }
    hid_t id() const { return file_.get(); }

    /**
     * @brief Flush HDF5 buffers, then sync according to the sync mode.
     *
     * Every mode except NoSync syncs. Sync and SyncOnFlush hand the fsync
     * to the worker; SyncBlock and SyncOnFlushBlock perform it before
     * returning. No-op on read-only files.
     */
    void flush();

    /**
     * @brief Flush, then fsync in the calling thread whatever the sync mode.
     * @throws StorageError if the file is read-only or closed
     */
    void flushSyncBlocking();

    /**
     * @brief Close the file and stop the sync worker.
     *
     * Sync and SyncBlock sync once more after closing. Idempotent.
     *
     * @throws StorageError if closing or a background sync failed
     */
    void close();

    // --- Datasets ---

    template <typename T>
    H5Dataset createDataset(
        const std::string& path,
        const std::vector<std::uint64_t>& dimensions,
        const std::optional<std::vector<std::uint32_t>>& chunkShape = std::nullopt,
        const std::optional<std::vector<std::uint64_t>>& maxDimensions = std::nullopt)
    {
        return createDatasetWithType(path, h5::storageType<T>(), dimensions, chunkShape, maxDimensions);
    }

    /** @brief Create a dataset whose elements are records of a compound type */
    H5Dataset createCompoundDataset(
        const std::string& path,
        const CompoundType& type,
        const std::vector<std::uint64_t>& dimensions,
        const std::optional<std::vector<std::uint32_t>>& chunkShape = std::nullopt,
        const std::optional<std::vector<std::uint64_t>>& maxDimensions = std::nullopt);

    /** @throws StorageError if the dataset does not exist */
    H5Dataset openDataset(const std::string& path) const;

    /** True if every component of path exists */
    bool exists(const std::string& path) const;

    // --- Compound types ---

    /** Uses the configured preference for existing types */
    std::shared_ptr<const CompoundType> compoundType(const std::string& name, const RecordShape& shape);

    std::shared_ptr<const CompoundType> compoundType(
        const std::string& name, const RecordShape& shape, bool preferExisting);

    std::vector<h5::CommittedMember> describeType(const std::string& name) const;

    TypeRegistry& types() { return *types_; }
    const TypeRegistry& types() const { return *types_; }

    /** fsync calls made for this file so far */
    std::size_t syncCount() const { return syncs_ + (sync_ ? sync_->syncCount() : 0); }

private:
    H5File(std::filesystem::path path, h5::Handle file, ContainerConfig config, bool readOnly);

    H5Dataset createDatasetWithType(
        const std::string& path,
        hid_t type,
        const std::vector<std::uint64_t>& dimensions,
        const std::optional<std::vector<std::uint32_t>>& chunkShape,
        const std::optional<std::vector<std::uint64_t>>& maxDimensions);

    void requireOpen(const char* operation) const;

    std::filesystem::path path_;
    h5::Handle file_;
    ContainerConfig config_;
    bool readOnly_;
    std::unique_ptr<TypeRegistry> types_;
    std::unique_ptr<h5::SyncWorker> sync_;
    std::size_t syncs_ = 0;
};

}  // namespace h5cx
