/// @file notification_observers.cpp
/// @brief NotificationObserver and NotificationPublisher factories

#include <vigil/source/notification_observers.hpp>

namespace vigil_source {

namespace {

std::shared_ptr<NotificationAdapter> adapter_for(const NotificationOptions& options) {
    auto center = options.center ? options.center : NotificationCenter::default_center();
    return std::make_shared<NotificationAdapter>(center);
}

} // anonymous namespace

vigil_core::Result<std::unique_ptr<NotificationObserver>> NotificationObserver::create(
    std::string name,
    Callback callback,
    NotificationOptions options)
{
    auto observer = vigil_observe::make_observer<Notification>(
        adapter_for(options),
        vigil_observe::Selector(std::move(name), options.sender),
        std::move(callback),
        vigil_observe::ObserverOptions{std::move(options.dispatcher)});
    if (!observer) {
        return observer.error();
    }
    return std::make_unique<NotificationObserver>(Key{}, std::move(*observer));
}

vigil_core::Result<std::unique_ptr<NotificationPublisher>> NotificationPublisher::create(
    std::string name,
    NotificationOptions options)
{
    auto publisher = Publisher::create(
        adapter_for(options),
        vigil_observe::Selector(std::move(name), options.sender),
        vigil_observe::ObserverOptions{std::move(options.dispatcher)});
    if (!publisher) {
        return publisher.error();
    }
    return std::make_unique<NotificationPublisher>(Key{}, std::move(*publisher));
}

} // namespace vigil_source
