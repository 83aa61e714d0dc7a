#include <thread>
#include <trueform/trueform.hpp>
#include <vector>

// Create, read, update and delete a dataset, then run a VM create job.
// Usage: dataset_lifecycle <pool>
int main(int argc, char **argv) {
    if (argc < 2) {
        echo::error("usage: dataset_lifecycle <pool>");
        return 1;
    }
    std::string dataset = std::string(argv[1]) + "/trueform-example";

    auto cfg = trueform::config::from_env();
    auto valid = trueform::config::validate(cfg);
    if (valid.is_err()) {
        echo::error(valid.error().message.c_str());
        return 1;
    }

    trueform::Client client(cfg);
    trueform::Context ctx;

    // Several threads share the client; the first call connects for all of them
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; i++) {
        readers.emplace_back([&client, &ctx, i] {
            auto info = client.call(ctx, "system.info");
            if (info.is_ok()) {
                echo::info("reader ", i, ": version ", info.value().value("version", "?").c_str());
            } else {
                echo::warn("reader ", i, ": ", info.error().to_string().c_str());
            }
        });
    }
    for (auto &t : readers) {
        t.join();
    }

    auto existing = client.get_instance(ctx, "pool.dataset", dataset);
    if (existing.is_ok()) {
        echo::info(dataset.c_str(), " already exists, removing it first");
        auto removed = client.remove_with_options(ctx, "pool.dataset", dataset, {{"recursive", true}});
        if (removed.is_err()) {
            echo::error(removed.error().to_string().c_str());
            return 1;
        }
    } else if (!trueform::is_not_found(existing.error())) {
        echo::error(existing.error().to_string().c_str());
        return 1;
    }

    auto created = client.create(ctx, "pool.dataset", {{"name", dataset}, {"compression", "LZ4"}});
    if (created.is_err()) {
        if (trueform::is_validation_error(created.error())) {
            echo::error("rejected: ", created.error().to_string().c_str());
        } else {
            echo::error(created.error().to_string().c_str());
        }
        return 1;
    }
    echo::info("created ", created.value().value("id", "").c_str());

    auto updated = client.update(ctx, "pool.dataset", dataset, {{"comments", "managed by trueform"}});
    if (updated.is_err()) {
        echo::error(updated.error().to_string().c_str());
        return 1;
    }

    auto removed = client.remove(ctx, "pool.dataset", dataset);
    if (removed.is_err()) {
        echo::error(removed.error().to_string().c_str());
        return 1;
    }
    echo::info("removed ", dataset.c_str());

    // Methods that run as jobs answer with a job id
    auto vm = client.create_with_job(ctx, "vm", {{"name", "trueformexample"}, {"memory", 512}}, 60000);
    if (vm.is_err()) {
        echo::warn("vm.create: ", vm.error().to_string().c_str());
    } else {
        echo::info("vm created: ", vm.value().dump().c_str());
    }

    const auto &metrics = client.metrics();
    echo::info("calls=", metrics.total_calls.load(), " ok=", metrics.successful_calls.load(),
               " avg_latency_us=", metrics.avg_latency_us());
    return 0;
}
