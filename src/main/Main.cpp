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

#include "app/CliArgs.hpp"
#include "app/VerifyConfig.hpp"
#include "migration/MigrationApplication.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/config/ConfigDescription.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/error_code.hpp>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <thread>

namespace {

/**
 * @brief Requests a graceful stop of the application on SIGINT and SIGTERM for as long as it lives
 */
class SignalHandler {
    boost::asio::io_context ioc_;
    boost::asio::signal_set signals_{ioc_, SIGINT, SIGTERM};
    std::thread worker_;

public:
    explicit SignalHandler(app::MigrationApplication& application)
    {
        signals_.async_wait([&application](boost::system::error_code const& ec, int signal) {
            if (ec)
                return;
            LOG(util::LogService::warn()) << "Received signal " << signal;
            application.stop();
        });
        worker_ = std::thread{[this] { ioc_.run(); }};
    }

    SignalHandler(SignalHandler const&) = delete;
    SignalHandler&
    operator=(SignalHandler const&) = delete;

    ~SignalHandler()
    {
        ioc_.stop();
        worker_.join();
    }
};

}  // namespace

int
main(int argc, char const* argv[])
try {
    auto const action = app::CliArgs::parse(argc, argv);
    return action.apply(
        [](app::CliArgs::Action::Exit const& exit) { return exit.exitCode; },
        [](app::CliArgs::Action::VerifyConfig const& verify) {
            if (app::parseConfig(verify.configPath)) {
                std::cout << "Config " << verify.configPath << " is correct" << std::endl;
                return EXIT_SUCCESS;
            }
            return EXIT_FAILURE;
        },
        [](app::CliArgs::Action::ConfigDescription const& description) {
            std::ofstream file(description.outputPath);
            if (not file) {
                std::cerr << "Could not open " << description.outputPath << std::endl;
                return EXIT_FAILURE;
            }
            util::config::CassmigConfigDescription::writeMarkdown(file);
            std::cout << "Config description written to " << description.outputPath << std::endl;
            return EXIT_SUCCESS;
        },
        [](app::CliArgs::Action::Migrate const& migrate) {
            if (not app::parseConfig(migrate.configPath))
                return EXIT_FAILURE;

            util::LogService::init(util::config::getCassmigConfig());
            app::MigrationApplication migrationApplication{util::config::getCassmigConfig(), migrate.subCmd};
            SignalHandler const signalHandler{migrationApplication};
            return migrationApplication.run();
        }
    );
} catch (std::exception const& e) {
    LOG(util::LogService::fatal()) << "Exit on exception: " << e.what();
    return EXIT_FAILURE;
}
