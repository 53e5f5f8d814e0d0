#include "signal_watcher.hpp"
#include <chrono>
#include <exception>
#include <spdlog/spdlog.h>

namespace grace::core {

SignalWatcher::SignalWatcher(infra::SignalSource& source)
    : slot_()
    , event_(slot_.get_future().share())
    , task_([this, &source] {
        try {
            slot_.set_value(source.next());
        } catch (...) {
            // отказ источника доставляем в wait(), а не теряем в потоке
            slot_.set_exception(std::current_exception());
        }
    })
{
    spdlog::debug("Signal watcher started");
}

auto SignalWatcher::wait() const -> infra::SignalEvent {
    return event_.get();
}

auto SignalWatcher::ready() const -> bool {
    return event_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace grace::core
