/**
 * @file snapshot_cache.cpp
 * @brief Implementation of SnapshotCache
 */

#include "service/snapshot_cache.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace budget
{

    SnapshotCache::SnapshotCache(std::unique_ptr<LedgerSource> source,
                                 AccountGroupConfig groups,
                                 analytics::AggregatorOptions options,
                                 bool fallback_to_demo)
        : source_(std::move(source)),
          groups_(std::move(groups)),
          aggregator_(options),
          fallback_to_demo_(fallback_to_demo)
    {
        if (!source_)
        {
            throw std::invalid_argument("SnapshotCache requires a ledger source");
        }
    }

    SnapshotCache::AggregatePtr SnapshotCache::refresh()
    {
        std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

        LedgerSnapshot snapshot;
        std::string source_name = source_->get_name();
        std::string fetch_error;
        bool is_demo = false;

        try
        {
            snapshot = source_->fetch();
        }
        catch (const std::exception &e)
        {
            if (!fallback_to_demo_)
            {
                throw;
            }

            fetch_error = e.what();
            if (aggregator_.options().verbose)
            {
                std::cerr << "Warning: ledger fetch from " << source_name << " failed ("
                          << fetch_error << "), using demonstration data\n";
            }

            snapshot = demo_source_.fetch();
            source_name = demo_source_.get_name();
            is_demo = true;
        }

        // A source that is itself the demo source also marks its output
        if (source_name == demo_source_.get_name())
        {
            is_demo = true;
        }

        auto aggregate = std::make_shared<analytics::DashboardAggregate>(
            aggregator_.compute(snapshot, groups_));
        aggregate->is_demo = is_demo;
        aggregate->source_name = source_name;
        aggregate->last_error = fetch_error;

        AggregatePtr published = std::move(aggregate);
        publish(published);
        return published;
    }

    void SnapshotCache::publish(AggregatePtr aggregate)
    {
        std::lock_guard<std::mutex> lock(publish_mutex_);
        last_updated_ = aggregate->generated_at;
        current_ = std::move(aggregate);
        ++refresh_count_;
    }

    SnapshotCache::AggregatePtr SnapshotCache::current() const
    {
        std::lock_guard<std::mutex> lock(publish_mutex_);
        return current_;
    }

    std::optional<std::chrono::system_clock::time_point> SnapshotCache::last_updated() const
    {
        std::lock_guard<std::mutex> lock(publish_mutex_);
        return last_updated_;
    }

    size_t SnapshotCache::refresh_count() const
    {
        std::lock_guard<std::mutex> lock(publish_mutex_);
        return refresh_count_;
    }

} // namespace budget
