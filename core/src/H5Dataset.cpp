#include "h5cx/core/h5/H5Dataset.hpp"

#include "h5cx/core/h5/H5Types.hpp"
#include "h5cx/core/util/Logging.hpp"

#include <algorithm>

namespace h5cx
{

namespace
{

std::string extentString(const std::vector<std::uint64_t>& v)
{
    std::string out = "[";
    for (std::size_t i = 0; i < v.size(); ++i) {
        out += (i ? ", " : "") + std::to_string(v[i]);
    }
    return out + "]";
}

// region must fit inside limits on every axis
void checkRegion(
    const std::vector<std::uint64_t>& limits,
    const std::vector<std::uint64_t>& offset,
    const std::vector<std::uint64_t>& shape,
    const std::string& what)
{
    if (offset.size() != limits.size() || shape.size() != limits.size()) {
        throw OutOfBoundsError(
            "region of rank " + std::to_string(offset.size()) + " used on " + what + " of rank " +
            std::to_string(limits.size()));
    }
    for (std::size_t i = 0; i < limits.size(); ++i) {
        if (offset[i] > limits[i] || shape[i] > limits[i] - offset[i]) {
            throw OutOfBoundsError(
                "region " + extentString(offset) + " + " + extentString(shape) + " leaves " +
                what + " of size " + extentString(limits));
        }
    }
}

}  // namespace

H5Dataset::H5Dataset(h5::Handle dataset, std::string path)
    : dataset_(std::move(dataset)), path_(std::move(path))
{
}

DatasetExtent H5Dataset::extent() const
{
    auto space = h5::own(H5Dget_space(dataset_.get()), H5Sclose, "get dataspace of " + path_);
    int rank = H5Sget_simple_extent_ndims(space.get());
    h5::check(rank, "get rank of " + path_);

    std::vector<hsize_t> dims(static_cast<std::size_t>(rank));
    std::vector<hsize_t> maxDims(static_cast<std::size_t>(rank));
    h5::check(
        H5Sget_simple_extent_dims(space.get(), dims.data(), maxDims.data()),
        "get dimensions of " + path_);

    DatasetExtent extent;
    extent.dimensions.assign(dims.begin(), dims.end());
    if (maxDims != dims) {
        extent.maxDimensions.emplace();
        for (auto m : maxDims) {
            extent.maxDimensions->push_back(m == H5S_UNLIMITED ? kUnlimited : m);
        }
    }

    auto dcpl = h5::own(H5Dget_create_plist(dataset_.get()), H5Pclose, "get creation properties of " + path_);
    H5D_layout_t layout = H5Pget_layout(dcpl.get());
    h5::check(layout, "get layout of " + path_);
    if (layout == H5D_CHUNKED) {
        std::vector<hsize_t> chunk(static_cast<std::size_t>(rank));
        h5::check(H5Pget_chunk(dcpl.get(), rank, chunk.data()), "get chunk shape of " + path_);
        extent.chunkShape.emplace();
        for (auto c : chunk) {
            extent.chunkShape->push_back(static_cast<std::uint32_t>(c));
        }
    }
    return extent;
}

void H5Dataset::extend(const std::vector<std::uint64_t>& dimensions)
{
    std::vector<hsize_t> dims(dimensions.begin(), dimensions.end());
    h5::check(H5Dset_extent(dataset_.get(), dims.data()), "extend " + path_ + " to " + extentString(dimensions));
    Logger()->debug("extended {} to {}", path_, extentString(dimensions));
}

template <typename T>
xt::xarray<T> H5Dataset::readBlock(
    const std::vector<std::uint64_t>& offset, const std::vector<std::uint32_t>& shape) const
{
    std::vector<std::size_t> arrayShape(shape.begin(), shape.end());
    auto out = xt::xarray<T>::from_shape(arrayShape);
    readRaw(h5::nativeType<T>(), offset, std::vector<std::uint64_t>(shape.begin(), shape.end()), out.data());
    return out;
}

template <typename T>
void H5Dataset::writeBlock(const xt::xarray<T>& data, const std::vector<std::uint64_t>& offset)
{
    std::vector<std::uint64_t> shape(data.shape().begin(), data.shape().end());
    if (shape.size() != offset.size()) {
        throw OutOfBoundsError(
            "block of rank " + std::to_string(shape.size()) + " written at offset of rank " +
            std::to_string(offset.size()) + " in " + path_);
    }

    auto current = extent();
    auto limits = current.dimensions;
    for (std::size_t i = 0; i < limits.size(); ++i) {
        if (current.isUnlimited(i)) {
            limits[i] = kUnlimited;
        } else if (current.maxDimensions) {
            limits[i] = (*current.maxDimensions)[i];
        }
    }
    checkRegion(limits, offset, shape, path_ + " (maximum extent)");

    auto needed = current.dimensions;
    for (std::size_t i = 0; i < shape.size(); ++i) {
        needed[i] = std::max(needed[i], offset[i] + shape[i]);
    }
    const bool grows = needed != current.dimensions;
    if (grows) {
        extend(needed);
    }

    try {
        writeRaw(h5::nativeType<T>(), offset, shape, data.data());
    } catch (const Error&) {
        if (grows) {
            // a failed write leaves the extent as it was
            std::vector<hsize_t> dims(current.dimensions.begin(), current.dimensions.end());
            if (H5Dset_extent(dataset_.get(), dims.data()) < 0) {
                Logger()->warn("could not restore extent of {} after failed write", path_);
            }
        }
        throw;
    }
}

void H5Dataset::readRaw(
    hid_t memType,
    const std::vector<std::uint64_t>& offset,
    const std::vector<std::uint64_t>& shape,
    void* buffer) const
{
    checkRegion(extent().dimensions, offset, shape, path_);
    if (std::find(shape.begin(), shape.end(), 0) != shape.end()) {
        return;
    }

    std::vector<hsize_t> start(offset.begin(), offset.end());
    std::vector<hsize_t> count(shape.begin(), shape.end());
    auto fileSpace = h5::own(H5Dget_space(dataset_.get()), H5Sclose, "get dataspace of " + path_);
    h5::check(
        H5Sselect_hyperslab(fileSpace.get(), H5S_SELECT_SET, start.data(), nullptr, count.data(), nullptr),
        "select region of " + path_);
    auto memSpace = h5::own(
        H5Screate_simple(static_cast<int>(count.size()), count.data(), nullptr), H5Sclose,
        "create memory dataspace");
    h5::check(
        H5Dread(dataset_.get(), memType, memSpace.get(), fileSpace.get(), H5P_DEFAULT, buffer),
        "read " + path_);
}

void H5Dataset::writeRaw(
    hid_t memType,
    const std::vector<std::uint64_t>& offset,
    const std::vector<std::uint64_t>& shape,
    const void* buffer)
{
    checkRegion(extent().dimensions, offset, shape, path_);
    if (std::find(shape.begin(), shape.end(), 0) != shape.end()) {
        return;
    }

    std::vector<hsize_t> start(offset.begin(), offset.end());
    std::vector<hsize_t> count(shape.begin(), shape.end());
    auto fileSpace = h5::own(H5Dget_space(dataset_.get()), H5Sclose, "get dataspace of " + path_);
    h5::check(
        H5Sselect_hyperslab(fileSpace.get(), H5S_SELECT_SET, start.data(), nullptr, count.data(), nullptr),
        "select region of " + path_);
    auto memSpace = h5::own(
        H5Screate_simple(static_cast<int>(count.size()), count.data(), nullptr), H5Sclose,
        "create memory dataspace");
    h5::check(
        H5Dwrite(dataset_.get(), memType, memSpace.get(), fileSpace.get(), H5P_DEFAULT, buffer),
        "write " + path_);
}

void H5Dataset::checkRecordAccess(const CompoundType& type, std::size_t codecSize) const
{
    if (codecSize != type.recordSize()) {
        throw EncodingError(
            "codec record size " + std::to_string(codecSize) + " does not match compound type '" +
            type.name() + "' of " + std::to_string(type.recordSize()) + " bytes");
    }
    if (extent().rank() != 1) {
        throw StorageError("compound records need a one-dimensional dataset, " + path_ + " is not");
    }
}

#define H5CX_DATASET_INSTANTIATE(T)                                         \
    template xt::xarray<T> H5Dataset::readBlock<T>(                         \
        const std::vector<std::uint64_t>&, const std::vector<std::uint32_t>&) const; \
    template void H5Dataset::writeBlock<T>(                                 \
        const xt::xarray<T>&, const std::vector<std::uint64_t>&);

H5CX_DATASET_INSTANTIATE(std::int8_t)
H5CX_DATASET_INSTANTIATE(std::int16_t)
H5CX_DATASET_INSTANTIATE(std::int32_t)
H5CX_DATASET_INSTANTIATE(std::int64_t)
H5CX_DATASET_INSTANTIATE(std::uint8_t)
H5CX_DATASET_INSTANTIATE(std::uint16_t)
H5CX_DATASET_INSTANTIATE(std::uint32_t)
H5CX_DATASET_INSTANTIATE(std::uint64_t)
H5CX_DATASET_INSTANTIATE(float)
H5CX_DATASET_INSTANTIATE(double)

#undef H5CX_DATASET_INSTANTIATE

}  // namespace h5cx
