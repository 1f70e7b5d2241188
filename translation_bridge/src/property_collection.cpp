#include "property_collection.h"

#include <stdexcept>

#include "speech_errors.h"

namespace speechbridge {

PropertyCollection::PropertyCollection(std::shared_ptr<NativeEngine> engine, PropertyBagHandle bag)
  : engine_(std::move(engine)), bag_(bag)
{
    if (!engine_) {
        throw std::invalid_argument("PropertyCollection requires a native engine.");
    }
    ThrowIfNull(bag_, "Invalid property bag handle");
}

PropertyCollection::~PropertyCollection() {
    Close();
}

PropertyBagHandle PropertyCollection::CheckedHandleLocked() const {
    if (bag_ == nullptr) {
        throw InvalidHandleError("PropertyCollection is closed; its recognizer has been disposed.");
    }
    return bag_;
}

std::string PropertyCollection::GetProperty(PropertyId id, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string value;
    ThrowIfFail(engine_->GetProperty(CheckedHandleLocked(), id, default_value, &value), "property_bag_get_string");
    return value;
}

std::string PropertyCollection::GetProperty(const std::string& name, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string value;
    ThrowIfFail(engine_->GetNamedProperty(CheckedHandleLocked(), name, default_value, &value), "property_bag_get_string");
    return value;
}

void PropertyCollection::SetProperty(PropertyId id, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    ThrowIfFail(engine_->SetProperty(CheckedHandleLocked(), id, value), "property_bag_set_string");
}

void PropertyCollection::SetProperty(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    ThrowIfFail(engine_->SetNamedProperty(CheckedHandleLocked(), name, value), "property_bag_set_string");
}

void PropertyCollection::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bag_ == nullptr) {
        return;
    }
    LogErrorIfFail(engine_->ReleasePropertyBag(bag_), "property_bag_release");
    bag_ = nullptr;
}

bool PropertyCollection::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bag_ == nullptr;
}

} // namespace speechbridge
