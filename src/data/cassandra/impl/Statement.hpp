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

#include "data/cassandra/impl/ManagedObject.hpp"

#include <cassandra.h>
#include <fmt/core.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace data::cassandra::impl {

template <typename>
constexpr bool kIS_OPTIONAL = false;

template <typename T>
constexpr bool kIS_OPTIONAL<std::optional<T>> = true;

template <typename>
constexpr bool kUNSUPPORTED = false;

class Statement : public ManagedObject<CassStatement> {
    static constexpr auto kDELETER = [](CassStatement* ptr) { cass_statement_free(ptr); };

public:
    /**
     * @brief Construct a new statement with optionally provided arguments.
     *
     * Note: it's up to the user to make sure the bound parameters match
     * the format of the query (e.g. amount of '?' matches count of args).
     *
     * @param query The query text
     * @param args The values to bind
     */
    template <typename... Args>
    explicit Statement(std::string_view query, Args&&... args)
        : ManagedObject{cass_statement_new_n(query.data(), query.size(), sizeof...(args)), kDELETER}
    {
        cass_statement_set_consistency(*this, CASS_CONSISTENCY_QUORUM);
        // neither schema changes nor conditional writes may be replayed by the driver
        cass_statement_set_is_idempotent(*this, cass_false);
        bind<Args...>(std::forward<Args>(args)...);
    }

    // TODO: figure out how to set consistency level in config
    // NOTE: Keep in sync with the consistency set above
    Statement(CassStatement* ptr) : ManagedObject{ptr, kDELETER}
    {
        cass_statement_set_consistency(*this, CASS_CONSISTENCY_QUORUM);
    }

    Statement(Statement&&) = default;

    /**
     * @brief Binads all given arguments in order starting at index 0.
     *
     * @param args The values to bind
     */
    template <typename... Args>
    void
    bind(Args&&... args) const
    {
        std::size_t idx = 0;  // NOLINT(misc-const-correctness)
        (this->bindAt<Args>(idx++, std::forward<Args>(args)), ...);
    }

    /**
     * @brief Binds the given value at the given index.
     *
     * @param idx The index of the '?' to bind
     * @param value The value
     */
    template <typename Type>
    void
    bindAt(std::size_t const idx, Type&& value) const
    {
        using DecayedType = std::decay_t<Type>;
        auto throwErrorIfNeeded = [idx](CassError rc, std::string_view label) {
            if (rc != CASS_OK)
                throw std::logic_error(fmt::format("[{}] at idx {}: {}", label, idx, cass_error_desc(rc)));
        };

        if constexpr (kIS_OPTIONAL<DecayedType>) {
            if (value.has_value()) {
                bindAt(idx, *value);
            } else {
                throwErrorIfNeeded(cass_statement_bind_null(*this, idx), "Bind null");
            }
        } else if constexpr (std::is_same_v<DecayedType, bool>) {
            auto const rc = cass_statement_bind_bool(*this, idx, value ? cass_true : cass_false);
            throwErrorIfNeeded(rc, "Bind bool");
        } else if constexpr (std::is_convertible_v<DecayedType, std::string_view>) {
            std::string_view const text{value};
            auto const rc = cass_statement_bind_string_n(*this, idx, text.data(), text.size());
            throwErrorIfNeeded(rc, "Bind string (as TEXT)");
        } else if constexpr (std::is_same_v<DecayedType, int32_t>) {
            auto const rc = cass_statement_bind_int32(*this, idx, value);
            throwErrorIfNeeded(rc, "Bind int32");
        } else if constexpr (std::is_same_v<DecayedType, int64_t>) {
            auto const rc = cass_statement_bind_int64(*this, idx, value);
            throwErrorIfNeeded(rc, "Bind int64");
        } else if constexpr (std::is_same_v<DecayedType, std::chrono::system_clock::time_point>) {
            // timestamp columns take milliseconds since epoch
            auto const millis =
                std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
            auto const rc = cass_statement_bind_int64(*this, idx, static_cast<cass_int64_t>(millis));
            throwErrorIfNeeded(rc, "Bind timestamp");
        } else {
            static_assert(kUNSUPPORTED<DecayedType>, "Unsupported type for binding");
        }
    }

    /**
     * @brief Sets the consistency used for the regular part of the statement.
     *
     * @param consistency The consistency level
     */
    void
    setConsistency(CassConsistency consistency) const
    {
        cass_statement_set_consistency(*this, consistency);
    }

    /**
     * @brief Sets the consistency used for the paxos round of a conditional statement.
     *
     * @param consistency The serial consistency level
     */
    void
    setSerialConsistency(CassConsistency consistency) const
    {
        cass_statement_set_serial_consistency(*this, consistency);
    }

    /**
     * @brief Route the statement to the given node only, bypassing the load balancing policy.
     *
     * @param node A node obtained from the future of an earlier request; must outlive the execution
     */
    void
    setNode(CassNode const* node) const
    {
        if (auto const rc = cass_statement_set_node(*this, node); rc != CASS_OK)
            throw std::logic_error(fmt::format("[Set node]: {}", cass_error_desc(rc)));
    }

    /**
     * @brief Route the statement to the host with the given address only.
     *
     * @throws std::logic_error if the address can't be parsed
     *
     * @param host IP address of the host
     * @param port Native protocol port of the host
     */
    void
    setHost(std::string_view host, uint16_t port) const
    {
        if (auto const rc = cass_statement_set_host_n(*this, host.data(), host.size(), port); rc != CASS_OK)
            throw std::logic_error(fmt::format("[Set host] {}:{}: {}", host, port, cass_error_desc(rc)));
    }
};

class PreparedStatement : public ManagedObject<CassPrepared const> {
    static constexpr auto kDELETER = [](CassPrepared const* ptr) { cass_prepared_free(ptr); };

public:
    /* implicit */ PreparedStatement(CassPrepared const* ptr) : ManagedObject{ptr, kDELETER}
    {
    }

    /**
     * @brief Bind the given arguments and produce a ready to execute Statement.
     *
     * @param args The arguments to bind
     * @return A bound and ready to execute Statement object
     */
    template <typename... Args>
    Statement
    bind(Args&&... args) const
    {
        Statement statement = cass_prepared_bind(*this);
        statement.bind<Args...>(std::forward<Args>(args)...);
        return statement;
    }
};

}  // namespace data::cassandra::impl
