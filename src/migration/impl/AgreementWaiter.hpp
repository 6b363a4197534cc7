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

#include "migration/MigrationError.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace migration::impl {

/**
 * @brief Schema version reported by one node; nullopt when the node does not know its schema version yet
 */
struct NodeSchemaVersion {
    std::string node;
    std::optional<std::string> schemaVersion;
};

/**
 * @brief Whether all nodes that report a schema version report the same one
 *
 * @param nodes The cluster agreement state
 * @return true if in agreement
 */
[[nodiscard]] inline bool
isInAgreement(std::vector<NodeSchemaVersion> const& nodes)
{
    std::optional<std::string> seen;
    return std::ranges::all_of(nodes, [&seen](auto const& node) {
        if (not node.schemaVersion.has_value())
            return true;
        if (not seen.has_value())
            seen = node.schemaVersion;
        return *seen == *node.schemaVersion;
    });
}

template <typename ReaderType>
concept NodeSchemaVersionReader = requires(ReaderType reader, std::optional<std::string> const& node) {
    { reader(node) } -> std::same_as<std::expected<std::optional<std::string>, MigrationError>>;
};

template <typename ReaderType>
concept PeerListReader = requires(ReaderType reader) {
    { reader() } -> std::same_as<std::expected<std::vector<std::string>, MigrationError>>;
};

/**
 * @brief Gather the schema version of every reachable node, each read from the node itself.
 *
 * The coordinator of the schema change is asked for its own version and for the list of its peers. Every peer is
 * then asked for its own version, so no node's view of another node is ever trusted. Peers that can't be reached
 * are left out.
 *
 * @param readVersion Reads `system.local` of the given node; nullopt names the coordinator
 * @param readPeers Lists the addresses of the coordinator's peers
 * @param log Logger to report skipped peers to
 * @return The versions; the first error that is not about a peer being unreachable otherwise
 */
template <NodeSchemaVersionReader VersionReaderType, PeerListReader PeersReaderType>
[[nodiscard]] std::expected<std::vector<NodeSchemaVersion>, MigrationError>
collectSchemaVersions(VersionReaderType&& readVersion, PeersReaderType&& readPeers, util::Logger const& log)
{
    auto const coordinatorVersion = readVersion(std::nullopt);
    if (not coordinatorVersion)
        return std::unexpected{coordinatorVersion.error()};

    auto const peers = readPeers();
    if (not peers)
        return std::unexpected{peers.error()};

    std::vector<NodeSchemaVersion> nodes{{.node = "coordinator", .schemaVersion = *coordinatorVersion}};
    for (auto const& peer : *peers) {
        auto const version = readVersion(peer);
        if (not version) {
            if (version.error().kind != MigrationError::Kind::Connectivity)
                return std::unexpected{version.error()};

            LOG(log.debug()) << "Peer " << peer << " is unreachable; left out of schema agreement";
            continue;
        }

        LOG(log.trace()) << "Peer " << peer << " schema version " << version->value_or("unknown");
        nodes.push_back({.node = peer, .schemaVersion = *version});
    }

    return nodes;
}

template <typename FetcherType>
concept SchemaVersionFetcher = requires(FetcherType fetcher) {
    { fetcher() } -> std::same_as<std::expected<std::vector<NodeSchemaVersion>, MigrationError>>;
};

/**
 * @brief Poll the cluster until all nodes report the same schema version.
 *
 * Errors of individual polls are logged and polling continues; only running out of time fails.
 *
 * @param fetcher Reads the current agreement state
 * @param timeout How long to wait in total
 * @param interval Pause between polls
 * @param log Logger to report progress to
 * @return Nothing on agreement; AgreementTimeout otherwise
 */
template <SchemaVersionFetcher FetcherType, typename ClockType = std::chrono::steady_clock>
[[nodiscard]] std::expected<void, MigrationError>
waitForAgreement(
    FetcherType&& fetcher,
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds interval,
    util::Logger const& log
)
{
    auto const deadline = ClockType::now() + timeout;
    std::size_t attempts = 0;
    std::string lastProblem = "no poll finished";

    while (true) {
        ++attempts;
        if (auto const state = fetcher(); state.has_value()) {
            if (isInAgreement(*state)) {
                LOG(log.debug()) << "Schema agreement reached after " << attempts << " poll(s)";
                return {};
            }
            lastProblem = fmt::format("{} node(s) polled, schema versions differ", state->size());
        } else {
            LOG(log.warn()) << "Polling schema versions failed: " << state.error();
            lastProblem = state.error().message;
        }

        if (ClockType::now() + interval > deadline)
            break;

        std::this_thread::sleep_for(interval);
    }

    return std::unexpected{MigrationError{
        MigrationError::Kind::AgreementTimeout,
        fmt::format("no schema agreement within {}ms after {} poll(s); {}", timeout.count(), attempts, lastProblem)
    }};
}

}  // namespace migration::impl
