#include "modelsmith/notifier.h"

#include <stdexcept>

#include "modelsmith/json_utils.h"
#include "modelsmith/logger.h"

namespace modelsmith
{

notifier::notifier(std::shared_ptr<callback_transport> transport) : transport_(std::move(transport))
{
    if (!transport_)
    {
        throw std::invalid_argument("callback_transport must not be null");
    }
}

nlohmann::json notifier::payload(const task_snapshot& snapshot)
{
    nlohmann::json body;
    body["task_id"] = snapshot.id;
    body["state"] = std::string{to_string(snapshot.state)};
    body["progress"] = snapshot.progress;
    if (snapshot.result_ref)
    {
        body["result_ref"] = *snapshot.result_ref;
    }
    if (snapshot.error)
    {
        body["error"] = *snapshot.error;
    }
    body["created_at"] = utils::format_timestamp(snapshot.created_at);
    if (snapshot.started_at)
    {
        body["started_at"] = utils::format_timestamp(*snapshot.started_at);
    }
    if (snapshot.finished_at)
    {
        body["finished_at"] = utils::format_timestamp(*snapshot.finished_at);
    }
    return body;
}

bool notifier::notify(const task_snapshot& snapshot)
{
    if (!snapshot.callback_url || snapshot.callback_url->empty())
    {
        return false;
    }

    const auto result = transport_->deliver(*snapshot.callback_url, payload(snapshot));
    if (!result)
    {
        ++dropped_;
        log::warn("Callback for task " + snapshot.id + " to " + *snapshot.callback_url + " failed: " + result.error());
        return false;
    }

    ++delivered_;
    log::debug("Callback for task " + snapshot.id + " delivered");
    return true;
}

} // namespace modelsmith
