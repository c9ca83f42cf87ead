#include "include/dev.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cstdint>
#include <system_error>
#include <sys/stat.h>

namespace fs = std::filesystem;

#define SYSFS_SECTOR_SIZE 512
#define SCSI_TYPE_ROM "5"

const char* deviceTypeName(DeviceType type) {
    switch (type) {
        case DeviceType::NVME:          return "NVMe";
        case DeviceType::SCSI:          return "ATA/SCSI";
        case DeviceType::SDMMC:         return "SD/MMC";
        case DeviceType::VIRTIO:        return "virtio";
        case DeviceType::LOOP:          return "loop";
        case DeviceType::MD:            return "md";
        case DeviceType::DEVICE_MAPPER: return "device-mapper";
        case DeviceType::OPTICAL:       return "optical";
        default:                        return "Unknown";
    }
}

bool BlockDeviceEnumerator::isBlockDevice(const std::string& path) const {
    struct stat buf;
    if (stat(path.c_str(), &buf) != 0)
        return false;

    return S_ISBLK(buf.st_mode);
}

// Helper to read a single line from a file
static bool readFileLine(const fs::path& path, std::string& value) {
    std::ifstream file(path);
    if (!file.is_open())
        return false;

    if (!std::getline(file, value))
        return false;

    // Trim whitespace/newlines
    value.erase(value.find_last_not_of(" \n\r\t") + 1);
    return true;
}

static bool readSectorCount(const fs::path& sysDir, uint64_t& sizeBytes) {
    std::string sizeStr;
    if (!readFileLine(sysDir / "size", sizeStr) || sizeStr.empty())
        return false;

    if (sizeStr.find_first_not_of("0123456789") != std::string::npos)
        return false;

    uint64_t sectors;
    try {
        sectors = std::stoull(sizeStr);
    } catch (const std::out_of_range&) {
        return false;
    }
    if (sectors > UINT64_MAX / SYSFS_SECTOR_SIZE)
        return false;

    sizeBytes = sectors * SYSFS_SECTOR_SIZE;
    return true;
}

static DeviceType detectType(const fs::path& sysDir, const std::string& name) {
    std::error_code ec;

    if (fs::is_directory(sysDir / "dm", ec) || name.rfind("dm-", 0) == 0)
        return DeviceType::DEVICE_MAPPER;
    if (fs::is_directory(sysDir / "md", ec))
        return DeviceType::MD;
    if (fs::is_directory(sysDir / "loop", ec))
        return DeviceType::LOOP;

    std::string scsiType;
    if (name.rfind("sr", 0) == 0 ||
        (readFileLine(sysDir / "device" / "type", scsiType) && scsiType == SCSI_TYPE_ROM))
        return DeviceType::OPTICAL;

    if (name.rfind("nvme", 0) == 0)
        return DeviceType::NVME;
    if (name.rfind("sd", 0) == 0)
        return DeviceType::SCSI;
    if (name.rfind("mmcblk", 0) == 0)
        return DeviceType::SDMMC;
    if (name.rfind("vd", 0) == 0)
        return DeviceType::VIRTIO;
    return DeviceType::UNKNOWN;
}


SysfsEnumerator::SysfsEnumerator(const std::string& sysBlockDir,
                                 const std::string& devDir,
                                 bool verbose)
    : sysBlockDir(sysBlockDir), devDir(devDir), verbose(verbose) {
}

std::vector<Device> SysfsEnumerator::getDevices() {
    std::vector<Device> devices;
    std::error_code ec;

    if (!fs::is_directory(sysBlockDir, ec))
        throw EnumerationError(sysBlockDir + " does not exist.");

    try {
        for (const auto& entry : fs::directory_iterator(sysBlockDir)) {
            if (!entry.is_directory(ec)) continue;

            // Kernel names use '!' where the /dev path has a subdirectory
            std::string name = entry.path().filename().string();
            std::string nodeName = name;
            for (char& c : nodeName) {
                if (c == '!') c = '/';
            }

            Device dev;
            dev.path = devDir + "/" + nodeName;
            dev.type = detectType(entry.path(), name);

            if (!readSectorCount(entry.path(), dev.sizeBytes)) {
                if (verbose)
                    std::cerr << dev.path << ": cannot read device size, skipping\n";
                continue;
            }
            if (dev.sizeBytes == 0) {
                if (verbose)
                    std::cerr << dev.path << ": no medium, skipping\n";
                continue;
            }

            devices.push_back(dev);
        }
    } catch (const fs::filesystem_error& e) {
        throw EnumerationError(std::string("cannot list block devices: ") + e.what());
    }

    return devices;
}
