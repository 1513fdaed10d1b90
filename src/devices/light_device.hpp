#pragma once

#include "devices/device_model.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace camlight::devices {

// One opened light. Handles are owned by whoever opened them for the
// duration of a single match/apply pass and are never cached across passes,
// so hot-plugged devices are picked up on the next pass.
class ILightHandle {
public:
  virtual ~ILightHandle() = default;

  virtual DeviceType Type() const = 0;
  virtual const std::string& Path() const = 0;
  virtual std::uint16_t ProductId() const = 0;

  // Reads the device serial. Returns false when the serial is unreadable;
  // an empty `serial` on success also means "no serial reported".
  virtual bool SerialNumber(std::string& serial, std::string& error) const = 0;

  // Primary light power.
  virtual bool SetPower(bool on, std::string& error) = 0;

  // Secondary (back) light power. Only meaningful when
  // `SupportsAuxiliaryLight(Type())`.
  virtual bool SetAuxiliaryPower(bool on, std::string& error) = 0;
};

// Enumeration/communication context to the light subsystem.
//
// Not assumed to be safe for concurrent use: the session shares one context
// between the startup scan and every scheduled apply and serializes access
// with its own mutex.
class ILightContext {
public:
  virtual ~ILightContext() = default;

  // Rescans connected devices. Must be called before `ConnectedDevices`
  // whenever a fresh view is needed.
  virtual bool Refresh(std::string& error) = 0;

  // Devices seen by the last successful `Refresh`.
  virtual std::vector<DeviceInfo> ConnectedDevices() const = 0;

  virtual bool Open(const DeviceInfo& device, std::unique_ptr<ILightHandle>& handle,
                    std::string& error) = 0;
};

// Real serial when readable and non-empty, otherwise a stable identifier
// synthesized from type, product id and path.
std::string SerialWithFallback(const ILightHandle& handle);

} // namespace camlight::devices
