#include "modelsmith/service.h"

#include <algorithm>
#include <iterator>
#include <system_error>

#include "modelsmith/http_callback_transport.h"
#include "modelsmith/input_classifier.h"
#include "modelsmith/logger.h"
#include "modelsmith/notifier.h"
#include "modelsmith/task_manager.h"
#include "process_conversion_engine.h"

namespace modelsmith
{

service::service(std::shared_ptr<content_store> store,
                 std::unique_ptr<task_manager> manager,
                 conversion_options defaults)
    : store_(std::move(store))
    , manager_(std::move(manager))
    , defaults_(std::move(defaults))
{
}

service::~service() = default;

std::expected<std::unique_ptr<service>, error> service::create(runtime_config runtime)
{
    if (runtime.data_root.empty())
    {
        return std::unexpected(error{error_code::validation, "data_root is required"});
    }
    if (auto valid = runtime.defaults.validate(); !valid)
    {
        return std::unexpected(error{error_code::validation, "Invalid default options: " + valid.error().message});
    }

    auto created = filesystem_content_store::create(runtime.data_root / "store");
    if (!created)
    {
        return std::unexpected(created.error());
    }
    auto store = std::make_shared<filesystem_content_store>(std::move(created.value()));

    if (!runtime.engine)
    {
        if (runtime.converter_command.empty())
        {
            return std::unexpected(error{error_code::validation, "A converter command is required"});
        }
        runtime.engine =
            std::make_shared<process_conversion_engine>(runtime.converter_command, store, runtime.data_root / "work");
    }

    if (!runtime.transport)
    {
        runtime.transport = std::make_shared<http_callback_transport>();
    }

    // Inputs of failed or cancelled tasks are not needed any more.
    auto cleanup = [weak = std::weak_ptr<content_store>(store)](const task_snapshot& snapshot,
                                                                const model_bundle& bundle)
    {
        const auto target = weak.lock();
        if (!target)
        {
            return;
        }
        for (const auto& ref : bundle.refs())
        {
            if (auto removed = target->remove(ref); !removed && removed.error().code != error_code::not_found)
            {
                log::warn("Cleanup of task " + snapshot.id + " could not remove " + ref + ": " +
                          removed.error().message);
            }
        }
    };

    task_manager_config config;
    config.worker_count = runtime.worker_count;
    config.queue_capacity = runtime.queue_capacity;
    config.logs_root = runtime.data_root / "logs";
    config.history_path = runtime.data_root / "history.jsonl";

    auto manager = task_manager::create(std::move(config),
                                        std::move(runtime.engine),
                                        std::make_shared<notifier>(std::move(runtime.transport)),
                                        std::move(cleanup));
    if (!manager)
    {
        return std::unexpected(manager.error());
    }

    return std::unique_ptr<service>(
        new service(std::move(store), std::move(manager.value()), std::move(runtime.defaults)));
}

void service::discard(const std::vector<std::string>& refs) const
{
    for (const auto& ref : refs)
    {
        if (auto removed = store_->remove(ref); !removed)
        {
            log::warn("Failed to discard upload " + ref + ": " + removed.error().message);
        }
    }
}

std::expected<submission, error> service::submit(conversion_request request) const
{
    std::vector<input_file> inputs;
    std::vector<std::string> refs;
    inputs.reserve(request.files.size());

    for (auto& file : request.files)
    {
        auto ref = store_->put(file.bytes, file.name);
        if (!ref)
        {
            discard(refs);
            return std::unexpected(ref.error());
        }
        refs.push_back(ref.value());
        inputs.push_back(input_file{std::move(file.name), std::move(ref.value())});
    }

    auto bundle = classify(inputs);
    if (!bundle)
    {
        discard(refs);
        return std::unexpected(bundle.error());
    }

    auto options = defaults_.merge_json(request.options);
    if (!options)
    {
        discard(refs);
        return std::unexpected(options.error());
    }

    // Inert files (readme, labels) are not part of the bundle.
    const auto used = bundle->refs();
    std::vector<std::string> unused;
    std::ranges::copy_if(refs, std::back_inserter(unused), [&](const std::string& ref)
                         { return std::ranges::find(used, ref) == used.end(); });

    auto task_id = manager_->submit(*bundle,
                                    std::move(options.value()),
                                    submit_options{std::move(request.task_id), std::move(request.callback_url)});
    if (!task_id)
    {
        discard(refs);
        return std::unexpected(task_id.error());
    }

    discard(unused);
    return submission{std::move(task_id.value()), std::move(bundle.value())};
}

std::expected<task_snapshot, error> service::get(const std::string& task_id) const
{
    return manager_->get(task_id);
}

std::vector<task_snapshot> service::list(task_filter filter) const
{
    return manager_->list(filter);
}

std::expected<void, error> service::cancel(const std::string& task_id) const
{
    return manager_->cancel(task_id);
}

std::vector<task_snapshot> service::history() const
{
    return manager_->history();
}

std::expected<std::string, error> service::read_log(const std::string& task_id) const
{
    return manager_->read_log(task_id);
}

std::expected<artifact, error> service::fetch_artifact(const std::string& task_id) const
{
    auto snapshot = manager_->get(task_id);
    if (!snapshot)
    {
        return std::unexpected(snapshot.error());
    }
    if (snapshot->state != task_state::completed || !snapshot->result_ref)
    {
        return std::unexpected(error{error_code::validation,
                                     "Task " + task_id + " is " + std::string{to_string(snapshot->state)} +
                                         ", no artifact available"});
    }

    auto bytes = store_->get(*snapshot->result_ref);
    if (!bytes)
    {
        return std::unexpected(bytes.error());
    }

    const auto& ref = *snapshot->result_ref;
    const auto slash = ref.find_last_of('/');
    return artifact{slash == std::string::npos ? ref : ref.substr(slash + 1), std::move(bytes.value())};
}

void service::shutdown() const
{
    manager_->shutdown();
}

} // namespace modelsmith
