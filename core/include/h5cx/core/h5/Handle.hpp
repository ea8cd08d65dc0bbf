#pragma once

#include <string>

#include <hdf5.h>

namespace h5cx::h5
{

/**
 * @brief Owning wrapper of an HDF5 identifier.
 *
 * The closer matching the identifier's kind (H5Fclose, H5Dclose, H5Tclose,
 * ...) runs when the handle is destroyed or reset. Move only.
 */
class Handle
{
public:
    using Closer = herr_t (*)(hid_t);

    Handle() = default;
    Handle(hid_t id, Closer closer) noexcept : id_(id), closer_(closer) {}
    ~Handle();

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;
    Handle(Handle&& other) noexcept;
    Handle& operator=(Handle&& other) noexcept;

    hid_t get() const noexcept { return id_; }
    bool valid() const noexcept { return id_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    /** Give up ownership without closing */
    hid_t release() noexcept;

    /**
     * @brief Close the identifier now.
     * @throws StorageError if the closer fails
     */
    void close();

private:
    void closeQuietly() noexcept;

    hid_t id_ = H5I_INVALID_HID;
    Closer closer_ = nullptr;
};

/** Current HDF5 error stack, one description per line */
std::string errorStack();

/** @throws StorageError with the HDF5 error stack if status < 0 */
void check(herr_t status, const std::string& what);

/** @throws StorageError with the HDF5 error stack if id < 0 */
hid_t checkId(hid_t id, const std::string& what);

/** Take ownership of a freshly returned identifier, checking it first */
Handle own(hid_t id, Handle::Closer closer, const std::string& what);

/**
 * @brief Turn off HDF5's automatic error printing for this process.
 *
 * Errors are reported through StorageError instead.
 */
void silenceErrorPrinting();

}  // namespace h5cx::h5
