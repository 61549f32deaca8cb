/**
 * @file InstrumentationEngine.hpp
 * @brief Ports to the dynamic instrumentation engine (device, session, script).
 */

#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace dualtap::domain {

/**
 * @class AttachFault
 * @brief Device lookup, attach, spawn or script load failed.
 */
class AttachFault : public std::runtime_error {
public:
    explicit AttachFault(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class ProcessNotFound
 * @brief The named process is not running on the device.
 */
class ProcessNotFound : public AttachFault {
public:
    explicit ProcessNotFound(const std::string& processName)
        : AttachFault("Process not found: " + processName), m_processName(processName) {}

    const std::string& processName() const { return m_processName; }

private:
    std::string m_processName;
};

/**
 * @class Script
 * @brief Hook payload loaded into a session.
 */
class Script {
public:
    /** @brief Receives the raw JSON text of every message the hooks send. */
    using MessageHandler = std::function<void(const std::string& message)>;

    virtual ~Script() = default;

    /** @brief Must be set before load(). Called on the engine's delivery thread. */
    virtual void setMessageHandler(MessageHandler handler) = 0;

    /** @throws AttachFault if the payload cannot be loaded. */
    virtual void load() = 0;

    virtual void unload() = 0;
};

/**
 * @class Session
 * @brief Controlling session against one process.
 */
class Session {
public:
    virtual ~Session() = default;

    /** @throws AttachFault if the script cannot be created. */
    virtual std::unique_ptr<Script> createScript(const std::string& source) = 0;

    virtual void detach() = 0;
};

/**
 * @class Device
 * @brief An instrumentation-capable device (e.g. a USB-attached phone).
 */
class Device {
public:
    virtual ~Device() = default;

    virtual std::string name() const = 0;

    /** @throws ProcessNotFound if no such process runs, AttachFault otherwise. */
    virtual std::unique_ptr<Session> attach(const std::string& processName) = 0;

    /** @throws AttachFault */
    virtual std::unique_ptr<Session> attach(int pid) = 0;

    /**
     * @brief Launches a fresh, suspended instance of a program.
     * @return Process id.
     * @throws AttachFault
     */
    virtual int spawn(const std::string& program) = 0;

    /** @throws AttachFault */
    virtual void resume(int pid) = 0;
};

/**
 * @class DeviceProvider
 * @brief Locates the device to instrument.
 */
class DeviceProvider {
public:
    virtual ~DeviceProvider() = default;

    /** @return The device, or nullptr if none appeared within the timeout. */
    virtual std::shared_ptr<Device> findDevice(std::chrono::milliseconds timeout) = 0;
};

} // namespace dualtap::domain
