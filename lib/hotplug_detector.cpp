#include <atomic>
#include <stdexcept>

#include "hotplug_detector.hpp"
#include "hotplug_log.hpp"

class HotplugDetector::HotplugDetectorImpl {
public:
    HotplugDetectorImpl(ScannerParams params, std::shared_ptr<USBBusScanner> scanner, bool allowDummyFallback)
        : m_params{PreprocessScannerParams(params)}, m_scanner{scanner}, m_allowDummyFallback{allowDummyFallback}
    {}

    HotplugEventStream Events(CancelToken &token)
    {
        HOTPLUG_LOG;

        if (m_streamOpen->exchange(true)) {
            throw std::logic_error("An event stream is already open on this detector");
        }

        try {
            if (!m_scanner) {
                m_scanner = ChooseBackend(m_allowDummyFallback);
            }
            m_scanner->Configure(m_params);
        } catch (...) {
            m_streamOpen->store(false);
            throw;
        }

        log(HOTPLUG_LOG_LEVEL_DEBUG) << "Opened event stream" << endLog;

        return HotplugEventStream(m_scanner, m_gate, token, m_streamOpen);
    }

    SuspendGate &GetGate()
    {
        return *m_gate;
    }

    const ScannerParams &GetParams() const
    {
        return m_params;
    }

private:
    ScannerParams m_params;
    std::shared_ptr<USBBusScanner> m_scanner;
    bool m_allowDummyFallback;
    std::shared_ptr<SuspendGate> m_gate = std::make_shared<SuspendGate>();
    std::shared_ptr<std::atomic<bool>> m_streamOpen = std::make_shared<std::atomic<bool>>(false);
};

HotplugDetector::HotplugDetector(ScannerParams params, std::shared_ptr<USBBusScanner> scanner, bool allowDummyFallback)
    : pImpl{std::make_unique<HotplugDetectorImpl>(params, scanner, allowDummyFallback)}
{}

HotplugDetector::~HotplugDetector() = default;

HotplugDetector::HotplugDetector(HotplugDetector&&) noexcept = default;

HotplugDetector& HotplugDetector::operator=(HotplugDetector&&) noexcept = default;

HotplugDetector HotplugDetector::ForDevice(const UsbId &vid, const UsbId &pid,
    std::shared_ptr<USBBusScanner> scanner, bool allowDummyFallback)
{
    ScannerParams params;
    params["idVendor"] = static_cast<int64_t>(UsbIdToInt(vid));
    params["idProduct"] = static_cast<int64_t>(UsbIdToInt(pid));

    return HotplugDetector(params, scanner, allowDummyFallback);
}

HotplugEventStream HotplugDetector::Events(CancelToken &token)
{
    return pImpl->Events(token);
}

DeviceStream HotplugDetector::AddedDevices(CancelToken &token)
{
    return DeviceStream(pImpl->Events(token), HOTPLUG_EVENT_ADDED);
}

DeviceStream HotplugDetector::RemovedDevices(CancelToken &token)
{
    return DeviceStream(pImpl->Events(token), HOTPLUG_EVENT_REMOVED);
}

void HotplugDetector::Suspend()
{
    pImpl->GetGate().Suspend();
}

void HotplugDetector::Resume()
{
    pImpl->GetGate().Resume();
}

bool HotplugDetector::IsSuspended() const
{
    return pImpl->GetGate().IsSuspended();
}

ScopedSuspend HotplugDetector::Suspended()
{
    return ScopedSuspend(pImpl->GetGate());
}

void HotplugDetector::RunForEachDevice(DeviceTask task, CancelToken &token,
    DevicePredicate predicate, bool cancellable)
{
    DeviceTaskSupervisor supervisor(task, predicate, cancellable);
    supervisor.Run(*this, token);
}

const ScannerParams &HotplugDetector::GetParams() const
{
    return pImpl->GetParams();
}
