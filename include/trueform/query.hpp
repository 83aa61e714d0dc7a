#pragma once

#include <trueform/common.hpp>

#include <initializer_list>
#include <string>
#include <vector>

namespace trueform {

    /// Builder for "<kind>.query" arguments: a filter list plus an options object.
    ///
    ///     QueryParams params;
    ///     params.filter("name", "=", "tank").limit(10).order_by({"name"});
    ///     client.query(ctx, "pool", &params);
    ///
    /// Filters are [field, op, value] triples combined with AND on the server.
    class QueryParams {
      private:
        Json filters_;
        dp::u32 limit_;
        dp::u32 offset_;
        bool count_;
        std::vector<std::string> order_by_;
        std::vector<std::string> select_;

      public:
        QueryParams() : filters_(Json::array()), limit_(0), offset_(0), count_(false) {}

        QueryParams &filter(const std::string &field, const std::string &op, const Json &value) {
            filters_.push_back(Json::array({field, op, value}));
            return *this;
        }

        QueryParams &limit(dp::u32 n) {
            limit_ = n;
            return *this;
        }

        QueryParams &offset(dp::u32 n) {
            offset_ = n;
            return *this;
        }

        QueryParams &count(bool enabled) {
            count_ = enabled;
            return *this;
        }

        QueryParams &order_by(std::initializer_list<std::string> fields) {
            order_by_.insert(order_by_.end(), fields.begin(), fields.end());
            return *this;
        }

        QueryParams &select(std::initializer_list<std::string> fields) {
            select_.insert(select_.end(), fields.begin(), fields.end());
            return *this;
        }

        const Json &filters() const { return filters_; }

        /// Options object, only keys with meaningful values
        Json options() const {
            Json opts = Json::object();
            if (limit_ > 0) {
                opts["limit"] = limit_;
            }
            if (offset_ > 0) {
                opts["offset"] = offset_;
            }
            if (count_) {
                opts["count"] = true;
            }
            if (!order_by_.empty()) {
                opts["order_by"] = order_by_;
            }
            if (!select_.empty()) {
                opts["select"] = select_;
            }
            return opts;
        }

        /// Positional params: [filters] or [filters, options]
        Json to_params() const {
            Json params = Json::array({filters_});
            Json opts = options();
            if (!opts.empty()) {
                params.push_back(opts);
            }
            return params;
        }
    };

} // namespace trueform
