//
// Created by redeg on 31/08/2025.
//

#pragma once

#include <chrono>
#include <functional>
#include <vector>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "core/ingest/LogEvent.hpp"
#include "logger/Logger.hpp"

namespace core::events {

    enum class EventType {
        COUNTERS_UPDATED,
        FILE_ACCESS_FAILED,
        FILE_SHRINK_DETECTED
    };

    struct Event {
        EventType type;
        std::string source;
        std::string message;
        ingest::CountersSnapshot counters; // filled for COUNTERS_UPDATED
        std::chrono::system_clock::time_point timestamp;

        Event(EventType t, std::string src, std::string msg = "")
                : type(t), source(std::move(src)), message(std::move(msg)),
                  timestamp(std::chrono::system_clock::now()) {}

        static Event countersUpdated(std::string sourcePath, ingest::CountersSnapshot snapshot) {
            Event event(EventType::COUNTERS_UPDATED, std::move(sourcePath));
            event.counters = std::move(snapshot);
            return event;
        }
    };

    class IEventObserver {
    public:
        virtual ~IEventObserver() = default;

        virtual void onEvent(const Event &event) = 0;
    };

    class EventBus {
    private:
        mutable std::mutex observersMutex_;
        std::vector<std::weak_ptr<IEventObserver>> observers_;

    public:
        static EventBus &getInstance() {
            static EventBus instance;
            return instance;
        }

        void subscribe(std::shared_ptr<IEventObserver> observer) {
            std::lock_guard<std::mutex> lock(observersMutex_);
            observers_.push_back(observer);
        }

        size_t observerCount() const {
            std::lock_guard<std::mutex> lock(observersMutex_);
            size_t alive = 0;
            for (const auto &observer: observers_) {
                if (!observer.expired()) alive++;
            }
            return alive;
        }

        void publish(const Event &event) {
            std::vector<std::shared_ptr<IEventObserver>> active;
            {
                std::lock_guard<std::mutex> lock(observersMutex_);

                // Clean up expired observers and collect active ones
                auto it = observers_.begin();
                while (it != observers_.end()) {
                    if (auto observer = it->lock()) {
                        active.push_back(std::move(observer));
                        ++it;
                    } else {
                        it = observers_.erase(it);
                    }
                }
            }

            // Observers may subscribe or publish from their handler
            for (const auto &observer: active) {
                try {
                    observer->onEvent(event);
                } catch (const std::exception &e) {
                    Logger::logError("[EventBus] Observer failed on " + event.source + ": " + e.what());
                }
            }
        }
    };

} // namespace core::events
