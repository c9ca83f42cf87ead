#ifndef LSHD_FAKE_ENUMERATOR_HPP
#define LSHD_FAKE_ENUMERATOR_HPP

#include <set>
#include <string>
#include <vector>
#include "dev.hpp"

// Reports a scripted device list. Paths added with addDevice() are block
// devices unless added with blockDevice = false.
class FakeEnumerator : public BlockDeviceEnumerator {
public:
    FakeEnumerator() = default;

    void addDevice(const std::string& path, DeviceType type, uint64_t sizeBytes,
                   bool blockDevice = true);
    void setFailing(bool failing);

    std::vector<Device> getDevices() override;
    bool isBlockDevice(const std::string& path) const override;

    std::string getName() const override {
        return "FakeEnumerator";
    }

    int calls = 0;

private:
    std::vector<Device> devices;
    std::set<std::string> blockPaths;
    bool failing = false;
};

#endif
