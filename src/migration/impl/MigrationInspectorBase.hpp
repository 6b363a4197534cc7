//------------------------------------------------------------------------------
/*
    This file is part of cassmig
    Copyright (c) 2024, the cassmig developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#pragma once

#include "migration/MigrationInspectorInterface.hpp"
#include "migration/MigrationResources.hpp"
#include "migration/MigrationStatus.hpp"
#include "migration/TrackingRecord.hpp"
#include "migration/TrackingStoreInterface.hpp"
#include "migration/Types.hpp"
#include "util/log/Logger.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace migration::impl {

/**
 * @brief The migration inspector implementation. It reports the status of the registered scripts against the tracking
 * store.
 */
class MigrationInspectorBase : virtual public MigrationInspectorInterface {
protected:
    util::Logger log_{"Migration"};
    std::shared_ptr<TrackingStoreInterface> store_;
    MigrationResources resources_;

public:
    /**
     * @brief Construct a new Migration Inspector object
     *
     * @param store The tracking store of the target cluster
     * @param resources The registry
     */
    MigrationInspectorBase(std::shared_ptr<TrackingStoreInterface> store, MigrationResources resources)
        : store_{std::move(store)}, resources_{std::move(resources)}
    {
    }

    std::vector<std::tuple<Version, std::string, MigrationStatus>>
    allScriptsStatus() const override
    {
        std::map<Version, std::tuple<Version, std::string, MigrationStatus>> statuses;

        auto const records = store_->getAppliedRecords();
        if (not records) {
            // a missing tracking table means nothing was applied yet
            auto const missing = records.error().kind == MigrationError::Kind::TrackingStoreMissing;
            if (not missing)
                LOG(log_.error()) << "Could not read the applied versions: " << records.error();

            for (auto const& script : resources_) {
                auto const status = missing ? MigrationStatus::Pending : MigrationStatus::NotKnown;
                statuses.emplace(script.version, std::make_tuple(script.version, script.description, status));
            }
        } else {
            for (auto const& script : resources_) {
                statuses.emplace(
                    script.version, std::make_tuple(script.version, script.description, MigrationStatus::Pending)
                );
            }
            // applied versions missing from the registry are reported as NotKnown
            for (auto const& record : *records) {
                auto const status =
                    resources_.find(record.version) == nullptr ? MigrationStatus::NotKnown : MigrationStatus::Applied;
                statuses.insert_or_assign(record.version, std::make_tuple(record.version, record.description, status));
            }
        }

        std::vector<std::tuple<Version, std::string, MigrationStatus>> result;
        result.reserve(statuses.size());
        for (auto& [_, status] : statuses)
            result.push_back(std::move(status));
        return result;
    }

    MigrationStatus
    getStatusByVersion(Version version) const override
    {
        auto const all = allScriptsStatus();
        auto const it = std::ranges::find_if(all, [version](auto const& entry) {
            return std::get<0>(entry) == version;
        });
        if (it == all.end())
            return MigrationStatus::NotKnown;
        return std::get<2>(*it);
    }

    std::vector<Version>
    pendingVersions() const override
    {
        std::vector<Version> pending;
        for (auto const& [version, _, status] : allScriptsStatus()) {
            if (status == MigrationStatus::Pending)
                pending.push_back(version);
        }
        return pending;
    }

    bool
    hasPending() const override
    {
        return not pendingVersions().empty();
    }
};

}  // namespace migration::impl
