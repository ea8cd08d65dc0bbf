#include "h5cx/core/h5/Handle.hpp"

#include "h5cx/core/util/Errors.hpp"
#include "h5cx/core/util/Logging.hpp"

#include <mutex>

namespace h5cx::h5
{

Handle::~Handle()
{
    closeQuietly();
}

Handle::Handle(Handle&& other) noexcept : id_(other.id_), closer_(other.closer_)
{
    other.id_ = H5I_INVALID_HID;
    other.closer_ = nullptr;
}

Handle& Handle::operator=(Handle&& other) noexcept
{
    if (this != &other) {
        closeQuietly();
        id_ = other.id_;
        closer_ = other.closer_;
        other.id_ = H5I_INVALID_HID;
        other.closer_ = nullptr;
    }
    return *this;
}

hid_t Handle::release() noexcept
{
    hid_t id = id_;
    id_ = H5I_INVALID_HID;
    closer_ = nullptr;
    return id;
}

void Handle::close()
{
    if (valid() && closer_) {
        Closer closer = closer_;
        hid_t id = release();
        check(closer(id), "close identifier");
    }
}

void Handle::closeQuietly() noexcept
{
    if (valid() && closer_) {
        if (closer_(id_) < 0) {
            Logger()->warn("failed to close HDF5 identifier {}", static_cast<long long>(id_));
        }
    }
    id_ = H5I_INVALID_HID;
    closer_ = nullptr;
}

std::string errorStack()
{
    std::string stack;
    herr_t walked = H5Ewalk2(
        H5E_DEFAULT, H5E_WALK_DOWNWARD,
        [](unsigned, const H5E_error2_t* err, void* data) -> herr_t {
            auto* out = static_cast<std::string*>(data);
            if (err->desc) {
                *out += "\n  ";
                if (err->func_name) {
                    *out += std::string(err->func_name) + ": ";
                }
                *out += err->desc;
            }
            return 0;
        },
        &stack);
    if (walked < 0) {
        stack += "\n  (error stack unavailable)";
    }
    if (H5Eclear2(H5E_DEFAULT) < 0) {
        stack += "\n  (error stack could not be cleared)";
    }
    return stack;
}

void check(herr_t status, const std::string& what)
{
    if (status < 0) {
        throw StorageError("HDF5: " + what + errorStack());
    }
}

hid_t checkId(hid_t id, const std::string& what)
{
    if (id < 0) {
        throw StorageError("HDF5: " + what + errorStack());
    }
    return id;
}

Handle own(hid_t id, Handle::Closer closer, const std::string& what)
{
    return Handle(checkId(id, what), closer);
}

void silenceErrorPrinting()
{
    static std::once_flag once;
    std::call_once(once, [] {
        if (H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr) < 0) {
            Logger()->warn("could not disable HDF5 error printing");
        }
    });
}

}  // namespace h5cx::h5
