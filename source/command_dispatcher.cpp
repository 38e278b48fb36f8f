#include "playnite/command_dispatcher.hpp"
#include "playnite/errors.hpp"
#include "playnite/logger.hpp"
#include "playnite/topic.hpp"

namespace playnite {

CommandDispatcher::CommandDispatcher(Publisher& publisher, EntityRegistry& registry, EntityPlatform& platform,
                                     DispatcherOptions options)
    : publisher_(publisher), registry_(registry), platform_(platform), options_(std::move(options)) {
    if (options_.publishRetries < 1) options_.publishRetries = 1;
}

bool CommandDispatcher::requestStart(const std::string& id, Clock::time_point now) {
    return dispatchToggle(id, CommandKind::Start, now);
}

bool CommandDispatcher::requestStop(const std::string& id, Clock::time_point now) {
    return dispatchToggle(id, CommandKind::Stop, now);
}

bool CommandDispatcher::requestInstall(const std::string& id, Clock::time_point now) {
    return dispatchPlain(id, CommandKind::Install, now);
}

bool CommandDispatcher::requestUninstall(const std::string& id, Clock::time_point now) {
    return dispatchPlain(id, CommandKind::Uninstall, now);
}

bool CommandDispatcher::requestLibraryRefresh(Clock::time_point now) {
    logInfo("Requesting library refresh", "CMD");
    return publishWithRetry(libraryRequestTopic(options_.topicBase), std::string(), now);
}

void CommandDispatcher::onUserCommand(const std::string& id, CommandKind kind) {
    switch (kind) {
        case CommandKind::Start: requestStart(id); break;
        case CommandKind::Stop: requestStop(id); break;
        case CommandKind::Install: requestInstall(id); break;
        case CommandKind::Uninstall: requestUninstall(id); break;
    }
}

void CommandDispatcher::onLibraryRefreshRequested() {
    requestLibraryRefresh();
}

bool CommandDispatcher::dispatchToggle(const std::string& id, CommandKind kind, Clock::time_point now) {
    if (!registry_.contains(id)) {
        logWarn(std::string(errorCodeLabel(ErrorCode::UnknownEntity)) + ": cannot " + commandKindLabel(kind) +
                    " unknown game " + id,
                "CMD");
        return false;
    }
    const bool start = kind == CommandKind::Start;
    platform_.onCommandHook(start ? CommandHook::BeforeStart : CommandHook::BeforeStop, id);

    CommandToken token = registry_.issueCommand(id, kind, now);
    if (token.valid) {
        platform_.setState(id, targetStateFor(kind));
        logInfo("Issued " + std::string(commandKindLabel(kind)) + " for " + id + " (#" +
                    std::to_string(token.sequence) + ")",
                "CMD");
    }
    // Fire-and-forget: the optimistic state stands even if the hand-off fails.
    const bool ok = publishWithRetry(commandTopic(options_.topicBase, kind), id, now);

    platform_.onCommandHook(start ? CommandHook::AfterStart : CommandHook::AfterStop, id);
    return ok;
}

bool CommandDispatcher::dispatchPlain(const std::string& id, CommandKind kind, Clock::time_point now) {
    if (!registry_.contains(id)) {
        logWarn(std::string(errorCodeLabel(ErrorCode::UnknownEntity)) + ": cannot " + commandKindLabel(kind) +
                    " unknown game " + id,
                "CMD");
        return false;
    }
    logInfo("Requesting " + std::string(commandKindLabel(kind)) + " for " + id, "CMD");
    return publishWithRetry(commandTopic(options_.topicBase, kind), id, now);
}

bool CommandDispatcher::publishWithRetry(const std::string& topic, const std::string& payload,
                                         Clock::time_point now) {
    return attemptPublish(QueuedPublish{topic, payload, 0, now}, now);
}

bool CommandDispatcher::attemptPublish(QueuedPublish item, Clock::time_point now) {
    std::string err;
    item.attempts++;
    if (publisher_.publish(item.topic, item.payload, err)) {
        published_++;
        return true;
    }
    logDebug("Publish attempt " + std::to_string(item.attempts) + "/" + std::to_string(options_.publishRetries) +
                 " to " + item.topic + " failed: " + err,
             "CMD");
    // Retrying only helps while the session is up; a reconnect replays the library request anyway.
    if (item.attempts < options_.publishRetries && publisher_.connected()) {
        item.due = now + options_.retryDelay;
        retryQueue_.push_back(std::move(item));
        return true;
    }
    publishFailures_++;
    logWarn(std::string(errorCodeLabel(ErrorCode::PublishFailure)) + ": " + item.topic + ": " + err, "CMD");
    return false;
}

void CommandDispatcher::retryDue(Clock::time_point now) {
    // Items requeued during this pass go to the back and are not due before now + retryDelay.
    for (size_t n = retryQueue_.size(); n > 0; --n) {
        QueuedPublish item = std::move(retryQueue_.front());
        retryQueue_.pop_front();
        if (item.due > now) {
            retryQueue_.push_back(std::move(item));
            continue;
        }
        retries_++;
        attemptPublish(std::move(item), now);
    }
}

size_t CommandDispatcher::tick(Clock::time_point now) {
    retryDue(now);
    auto expired = registry_.expirePending(now, options_.commandTimeout);
    for (const auto& e : expired) {
        timeouts_++;
        logInfo(std::string(errorCodeLabel(ErrorCode::CommandTimeout)) + ": " + commandKindLabel(e.kind) + " for " +
                    e.id + " (#" + std::to_string(e.sequence) + ") was never confirmed",
                "CMD");
    }
    return expired.size();
}

DispatcherStats CommandDispatcher::stats() const {
    DispatcherStats s;
    s.published = published_.load();
    s.publishFailures = publishFailures_.load();
    s.retries = retries_.load();
    s.timeouts = timeouts_.load();
    return s;
}

} // namespace playnite
