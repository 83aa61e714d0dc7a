#include <trueform/trueform.hpp>

// Lists pools and their datasets on the host named by TRUENAS_HOST
int main() {
    auto cfg = trueform::config::from_env();
    auto valid = trueform::config::validate(cfg);
    if (valid.is_err()) {
        echo::error(valid.error().message.c_str());
        return 1;
    }

    trueform::Client client(cfg);
    trueform::Context ctx;

    auto connect_res = client.connect(ctx);
    if (connect_res.is_err()) {
        echo::error(connect_res.error().to_string().c_str());
        return 1;
    }

    auto pools_res = client.query(ctx, "pool");
    if (pools_res.is_err()) {
        echo::error("pool.query failed: ", pools_res.error().to_string().c_str());
        return 1;
    }

    for (const auto &pool : pools_res.value()) {
        std::string name = pool.value("name", "");
        echo::info("pool ", name.c_str(), " status=", pool.value("status", "?").c_str());

        trueform::QueryParams params;
        params.filter("pool", "=", name).select({"id", "type"}).order_by({"id"});

        auto datasets_res = client.query(ctx, "pool.dataset", &params);
        if (datasets_res.is_err()) {
            echo::warn("  dataset query failed: ", datasets_res.error().to_string().c_str());
            continue;
        }
        for (const auto &dataset : datasets_res.value()) {
            echo::info("  ", dataset.value("id", "").c_str(), " (", dataset.value("type", "").c_str(), ")");
        }
    }

    client.close();
    return 0;
}
