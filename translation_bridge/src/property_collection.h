#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "native_engine.h"

namespace speechbridge {

// String properties stored in a native property bag.
// The collection is only valid until the recognizer owning it is closed; after
// Close() every accessor throws InvalidHandleError.
class PropertyCollection {
public:
    PropertyCollection(std::shared_ptr<NativeEngine> engine, PropertyBagHandle bag);
    ~PropertyCollection();

    PropertyCollection(const PropertyCollection&) = delete;
    PropertyCollection& operator=(const PropertyCollection&) = delete;

    std::string GetProperty(PropertyId id, const std::string& default_value = "") const;
    std::string GetProperty(const std::string& name, const std::string& default_value = "") const;

    void SetProperty(PropertyId id, const std::string& value);
    void SetProperty(const std::string& name, const std::string& value);

    // Releases the native bag. Safe to call more than once.
    void Close();
    bool IsClosed() const;

private:
    PropertyBagHandle CheckedHandleLocked() const;

    std::shared_ptr<NativeEngine> engine_;
    mutable std::mutex mutex_;
    PropertyBagHandle bag_;
};

} // namespace speechbridge
