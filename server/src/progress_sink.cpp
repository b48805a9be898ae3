#include "chunkvault/server/progress_sink.hpp"

#include <chrono>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace chunkvault::server
{

    using chunkvault::protocol::ProgressEvent;
    using chunkvault::protocol::ProgressEventType;

    ProgressEvent make_event(ProgressEventType type, const std::string &file_id)
    {
        ProgressEvent event{};
        event.type = type;
        event.file_id = file_id;
        event.timestamp_ms = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                            std::chrono::system_clock::now().time_since_epoch())
                                                            .count());
        return event;
    }

    void LoggingProgressSink::notify_progress(const std::string &file_id, const ProgressEvent &event)
    {
        spdlog::debug("[{}] {} {}/{} {}", file_id, chunkvault::protocol::to_string(event.type), event.uploaded_chunks,
                      event.total_chunks, event.message);
    }

    void LoggingProgressSink::notify_error(const std::string &file_id, const std::string &message)
    {
        spdlog::debug("[{}] error: {}", file_id, message);
    }

    void LoggingProgressSink::notify_completion(const std::string &file_id, const std::string &final_path)
    {
        spdlog::debug("[{}] completed: {}", file_id, final_path);
    }

    ProgressHub::SubscriptionId ProgressHub::subscribe(const std::string &file_id, Observer observer)
    {
        std::lock_guard lock(mutex_);
        const auto id = next_id_++;
        observers_[file_id].emplace(id, std::move(observer));
        index_.emplace(id, file_id);
        return id;
    }

    void ProgressHub::unsubscribe(SubscriptionId id)
    {
        std::lock_guard lock(mutex_);
        const auto it = index_.find(id);
        if (it != index_.end())
        {
            const auto file_id = it->second;
            erase_locked(file_id, id);
        }
    }

    std::size_t ProgressHub::observer_count(const std::string &file_id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = observers_.find(file_id);
        return it == observers_.end() ? 0 : it->second.size();
    }

    void ProgressHub::notify_progress(const std::string &file_id, const ProgressEvent &event)
    {
        std::vector<std::pair<SubscriptionId, Observer>> targets;
        {
            std::lock_guard lock(mutex_);
            const auto it = observers_.find(file_id);
            if (it == observers_.end())
            {
                return;
            }
            targets.assign(it->second.begin(), it->second.end());
        }

        // Delivered outside the lock so observers may unsubscribe from inside the callback.
        for (const auto &[id, observer] : targets)
        {
            try
            {
                observer(event);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Dropping progress observer {} of {}: {}", id, file_id, ex.what());
                drop(file_id, id);
            }
            catch (...)
            {
                spdlog::warn("Dropping progress observer {} of {}: unknown exception", id, file_id);
                drop(file_id, id);
            }
        }
    }

    void ProgressHub::notify_error(const std::string &file_id, const std::string &message)
    {
        auto event = make_event(ProgressEventType::Error, file_id);
        event.message = message;
        notify_progress(file_id, event);
    }

    void ProgressHub::notify_completion(const std::string &file_id, const std::string &final_path)
    {
        auto event = make_event(ProgressEventType::Completed, file_id);
        event.message = "Upload completed successfully";
        event.file_path = final_path;
        event.progress = 100.0;
        notify_progress(file_id, event);
    }

    void ProgressHub::drop(const std::string &file_id, SubscriptionId id)
    {
        std::lock_guard lock(mutex_);
        erase_locked(file_id, id);
    }

    void ProgressHub::erase_locked(const std::string &file_id, SubscriptionId id)
    {
        index_.erase(id);
        auto it = observers_.find(file_id);
        if (it == observers_.end())
        {
            return;
        }
        it->second.erase(id);
        if (it->second.empty())
        {
            observers_.erase(it);
        }
    }

} // namespace chunkvault::server
