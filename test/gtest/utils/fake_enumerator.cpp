#include "fake_enumerator.hpp"

void FakeEnumerator::addDevice(const std::string& path, DeviceType type, uint64_t sizeBytes,
                               bool blockDevice) {
    devices.push_back(Device{path, type, sizeBytes});
    if (blockDevice)
        blockPaths.insert(path);
}

void FakeEnumerator::setFailing(bool failing) {
    this->failing = failing;
}

std::vector<Device> FakeEnumerator::getDevices() {
    calls++;
    if (failing)
        throw EnumerationError("fake enumeration failure");
    return devices;
}

bool FakeEnumerator::isBlockDevice(const std::string& path) const {
    return blockPaths.count(path) > 0;
}
