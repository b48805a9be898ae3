#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "chunkvault/protocol.hpp"

namespace chunkvault::server
{

    // Fire-and-forget observer of upload progress. Implementations must not throw back into the engine.
    class ProgressSink
    {
    public:
        virtual ~ProgressSink() = default;

        virtual void notify_progress(const std::string &file_id, const chunkvault::protocol::ProgressEvent &event) = 0;
        virtual void notify_error(const std::string &file_id, const std::string &message) = 0;
        virtual void notify_completion(const std::string &file_id, const std::string &final_path) = 0;
    };

    chunkvault::protocol::ProgressEvent make_event(chunkvault::protocol::ProgressEventType type,
                                                   const std::string &file_id);

    class LoggingProgressSink : public ProgressSink
    {
    public:
        void notify_progress(const std::string &file_id, const chunkvault::protocol::ProgressEvent &event) override;
        void notify_error(const std::string &file_id, const std::string &message) override;
        void notify_completion(const std::string &file_id, const std::string &final_path) override;
    };

    /**
     * Fans events out to observers subscribed per file id.
     *
     * An observer that throws is treated as disconnected: it is logged and dropped.
     */
    class ProgressHub : public ProgressSink
    {
    public:
        using Observer = std::function<void(const chunkvault::protocol::ProgressEvent &)>;
        using SubscriptionId = std::uint64_t;

        SubscriptionId subscribe(const std::string &file_id, Observer observer);
        void unsubscribe(SubscriptionId id);

        std::size_t observer_count(const std::string &file_id) const;

        void notify_progress(const std::string &file_id, const chunkvault::protocol::ProgressEvent &event) override;
        void notify_error(const std::string &file_id, const std::string &message) override;
        void notify_completion(const std::string &file_id, const std::string &final_path) override;

    private:
        void drop(const std::string &file_id, SubscriptionId id);
        void erase_locked(const std::string &file_id, SubscriptionId id);

        mutable std::mutex mutex_;
        SubscriptionId next_id_{1};
        std::unordered_map<std::string, std::map<SubscriptionId, Observer>> observers_;
        std::unordered_map<SubscriptionId, std::string> index_;
    };

} // namespace chunkvault::server
