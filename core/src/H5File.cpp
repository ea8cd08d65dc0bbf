#include "h5cx/core/h5/H5File.hpp"

#include "h5cx/core/util/Errors.hpp"
#include "h5cx/core/util/Logging.hpp"

#include <sstream>

namespace h5cx
{

namespace
{

h5::Handle openFile(const std::filesystem::path& path, unsigned flags)
{
    h5::silenceErrorPrinting();
    if (!std::filesystem::exists(path)) {
        throw StorageError("H5File: file not found: " + path.string());
    }
    return h5::own(H5Fopen(path.c_str(), flags, H5P_DEFAULT), H5Fclose, "open " + path.string());
}

}  // namespace

H5File::H5File(std::filesystem::path path, h5::Handle file, ContainerConfig config, bool readOnly)
    : path_(std::move(path))
    , file_(std::move(file))
    , config_(std::move(config))
    , readOnly_(readOnly)
    , types_(std::make_unique<TypeRegistry>(file_.get(), config_.replaceConflictingTypes))
{
    if (!readOnly_ && config_.syncMode != SyncMode::NoSync) {
        sync_ = std::make_unique<h5::SyncWorker>(path_);
    }
}

std::unique_ptr<H5File> H5File::create(const std::filesystem::path& path, const ContainerConfig& config)
{
    h5::silenceErrorPrinting();
    if (!config.overwrite && std::filesystem::exists(path)) {
        throw StorageError("H5File: " + path.string() + " exists and overwrite is disabled");
    }
    unsigned flags = config.overwrite ? H5F_ACC_TRUNC : H5F_ACC_EXCL;
    auto file = h5::own(
        H5Fcreate(path.c_str(), flags, H5P_DEFAULT, H5P_DEFAULT), H5Fclose,
        "create " + path.string());
    Logger()->debug("created {} (sync mode {})", path.string(), toString(config.syncMode));
    return std::unique_ptr<H5File>(new H5File(path, std::move(file), config, false));
}

std::unique_ptr<H5File> H5File::open(const std::filesystem::path& path, const ContainerConfig& config)
{
    auto file = openFile(path, H5F_ACC_RDWR);
    return std::unique_ptr<H5File>(new H5File(path, std::move(file), config, false));
}

std::unique_ptr<H5File> H5File::openReadOnly(
    const std::filesystem::path& path, const ContainerConfig& config)
{
    auto file = openFile(path, H5F_ACC_RDONLY);
    return std::unique_ptr<H5File>(new H5File(path, std::move(file), config, true));
}

H5File::~H5File()
{
    try {
        close();
    } catch (const Error& e) {
        Logger()->error("closing {} failed: {}", path_.string(), e.what());
    }
}

void H5File::requireOpen(const char* operation) const
{
    if (!file_.valid()) {
        throw StorageError(std::string("H5File: ") + operation + " on closed file " + path_.string());
    }
}

void H5File::flush()
{
    requireOpen("flush");
    if (readOnly_) {
        return;
    }
    h5::check(H5Fflush(file_.get(), H5F_SCOPE_GLOBAL), "flush " + path_.string());

    if (!sync_ || !syncsOnFlush(config_.syncMode)) {
        return;
    }
    if (isNonBlocking(config_.syncMode)) {
        sync_->post(h5::SyncWorker::Command::Sync);
    } else {
        sync_->syncNow();
    }
}

void H5File::flushSyncBlocking()
{
    requireOpen("flushSyncBlocking");
    if (readOnly_) {
        throw StorageError("H5File: flushSyncBlocking on read-only file " + path_.string());
    }
    h5::check(H5Fflush(file_.get(), H5F_SCOPE_GLOBAL), "flush " + path_.string());

    if (sync_) {
        sync_->syncNow();
    } else {
        h5::fsyncFile(path_);
        ++syncs_;
    }
}

void H5File::close()
{
    if (!file_.valid()) {
        return;
    }

    types_->clear();
    file_.close();

    if (!sync_) {
        return;
    }

    // the worker is released even when the last sync throws
    auto worker = std::move(sync_);
    const auto mode = config_.syncMode;
    if (syncsOnClose(mode)) {
        if (isNonBlocking(mode)) {
            worker->post(h5::SyncWorker::Command::Sync);
        } else {
            worker->syncNow();
        }
    }
    if (isNonBlocking(mode)) {
        worker->post(h5::SyncWorker::Command::CloseSync);
    } else {
        worker->closeDescriptor();
        worker->post(h5::SyncWorker::Command::Exit);
    }
    worker->finish();
    syncs_ += worker->syncCount();
}

H5Dataset H5File::createDatasetWithType(
    const std::string& path,
    hid_t type,
    const std::vector<std::uint64_t>& dimensions,
    const std::optional<std::vector<std::uint32_t>>& chunkShape,
    const std::optional<std::vector<std::uint64_t>>& maxDimensions)
{
    requireOpen("createDataset");
    const auto rank = dimensions.size();
    if (rank == 0) {
        throw OutOfBoundsError("dataset " + path + " needs at least one dimension");
    }
    if ((chunkShape && chunkShape->size() != rank) || (maxDimensions && maxDimensions->size() != rank)) {
        throw OutOfBoundsError("chunk or maximum dimensions of " + path + " do not match its rank");
    }
    if (maxDimensions && !chunkShape) {
        throw StorageError("extendable dataset " + path + " needs a chunk shape");
    }

    std::vector<hsize_t> dims(dimensions.begin(), dimensions.end());
    std::vector<hsize_t> maxDims;
    if (maxDimensions) {
        for (auto m : *maxDimensions) {
            maxDims.push_back(m == kUnlimited ? H5S_UNLIMITED : m);
        }
    }
    auto space = h5::own(
        H5Screate_simple(static_cast<int>(rank), dims.data(), maxDims.empty() ? nullptr : maxDims.data()),
        H5Sclose, "create dataspace for " + path);

    auto dcpl = h5::own(H5Pcreate(H5P_DATASET_CREATE), H5Pclose, "create dataset properties");
    if (chunkShape) {
        std::vector<hsize_t> chunk(chunkShape->begin(), chunkShape->end());
        h5::check(H5Pset_chunk(dcpl.get(), static_cast<int>(rank), chunk.data()), "set chunk shape of " + path);
    }
    auto lcpl = h5::own(H5Pcreate(H5P_LINK_CREATE), H5Pclose, "create link properties");
    h5::check(H5Pset_create_intermediate_group(lcpl.get(), 1), "enable intermediate groups");

    auto dataset = h5::own(
        H5Dcreate2(file_.get(), path.c_str(), type, space.get(), lcpl.get(), dcpl.get(), H5P_DEFAULT),
        H5Dclose, "create dataset " + path);
    Logger()->debug("created dataset {} in {}", path, path_.string());
    return H5Dataset(std::move(dataset), path);
}

H5Dataset H5File::createCompoundDataset(
    const std::string& path,
    const CompoundType& type,
    const std::vector<std::uint64_t>& dimensions,
    const std::optional<std::vector<std::uint32_t>>& chunkShape,
    const std::optional<std::vector<std::uint64_t>>& maxDimensions)
{
    return createDatasetWithType(path, type.storageTypeId(), dimensions, chunkShape, maxDimensions);
}

H5Dataset H5File::openDataset(const std::string& path) const
{
    requireOpen("openDataset");
    if (!exists(path)) {
        throw StorageError("H5File: no dataset " + path + " in " + path_.string());
    }
    auto dataset = h5::own(H5Dopen2(file_.get(), path.c_str(), H5P_DEFAULT), H5Dclose, "open dataset " + path);
    return H5Dataset(std::move(dataset), path);
}

bool H5File::exists(const std::string& path) const
{
    requireOpen("exists");

    // H5Lexists needs every intermediate link to exist
    std::string prefix;
    std::istringstream components(path);
    std::string component;
    while (std::getline(components, component, '/')) {
        if (component.empty()) {
            continue;
        }
        prefix += "/" + component;
        htri_t found = H5Lexists(file_.get(), prefix.c_str(), H5P_DEFAULT);
        h5::check(found, "look up " + prefix);
        if (found == 0) {
            return false;
        }
    }
    return !prefix.empty();
}

std::shared_ptr<const CompoundType> H5File::compoundType(const std::string& name, const RecordShape& shape)
{
    return compoundType(name, shape, config_.preferExistingTypes);
}

std::shared_ptr<const CompoundType> H5File::compoundType(
    const std::string& name, const RecordShape& shape, bool preferExisting)
{
    requireOpen("compoundType");
    return types_->getOrCreate(name, shape, preferExisting);
}

std::vector<h5::CommittedMember> H5File::describeType(const std::string& name) const
{
    requireOpen("describeType");
    return types_->describe(name);
}

}  // namespace h5cx
