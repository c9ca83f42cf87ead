#ifndef LSHD_DEV_HPP
#define LSHD_DEV_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

enum class DeviceType {
    NVME,
    SCSI,       // sd*, covers ATA and USB mass storage
    SDMMC,
    VIRTIO,
    LOOP,
    MD,
    DEVICE_MAPPER,
    OPTICAL,
    UNKNOWN
};

const char* deviceTypeName(DeviceType type);


struct Device {
    std::string path;
    DeviceType type;
    uint64_t sizeBytes;
};

// Thrown when the platform device listing cannot be obtained at all.
class EnumerationError : public std::runtime_error {
public:
    explicit EnumerationError(const std::string& what) : std::runtime_error(what) {}
};

class BlockDeviceEnumerator {
public:
    virtual ~BlockDeviceEnumerator() = default;

    // Every block device known to the platform. Throws EnumerationError.
    virtual std::vector<Device> getDevices() = 0;

    // False when path is not a block special file or cannot be stat'ed.
    virtual bool isBlockDevice(const std::string& path) const;

    // Per-device diagnostics on stderr.
    virtual void setVerbose(bool) {}

    virtual std::string getName() const = 0;
};

// Lists devices from the kernel's /sys/block view. devDir only changes the
// reported paths, for fixture trees; the catalog rules always match /dev/.
class SysfsEnumerator : public BlockDeviceEnumerator {
public:
    SysfsEnumerator(const std::string& sysBlockDir = "/sys/block",
                    const std::string& devDir = "/dev",
                    bool verbose = false);

    std::vector<Device> getDevices() override;

    void setVerbose(bool verbose) override {
        this->verbose = verbose;
    }

    std::string getName() const override {
        return "SysfsEnumerator";
    }

private:
    std::string sysBlockDir;
    std::string devDir;
    bool verbose;
};

#endif
