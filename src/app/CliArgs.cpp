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

#include "migration/MigrationApplication.hpp"

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace app {

CliArgs::Action
CliArgs::parse(int argc, char const* argv[])
{
    namespace po = boost::program_options;

    // clang-format off
    po::options_description description("Options");
    description.add_options()
        ("help,h", "print help message and exit")
        ("version,v", "print version and exit")
        ("conf,c", po::value<std::string>()->default_value(kDEFAULT_CONFIG_PATH), "configuration file")
        ("migrate", po::value<std::string>()->default_value("run"), "migration command: run or status")
        ("verify", "checks the validity of config values")
        ("config-description,d", po::value<std::string>(), "generate config description markdown file")
    ;
    // clang-format on

    po::positional_options_description positional;
    positional.add("conf", 1);

    po::variables_map parsed;
    try {
        po::store(po::command_line_parser(argc, argv).options(description).positional(positional).run(), parsed);
        po::notify(parsed);
    } catch (po::error const& e) {
        std::cerr << e.what() << "\n\n" << description;
        return Action{Action::Exit{EXIT_FAILURE}};
    }

    if (parsed.contains("help")) {
        std::cout << "cassmig applies versioned CQL schema changes to a Cassandra cluster\n\n" << description;
        return Action{Action::Exit{EXIT_SUCCESS}};
    }

    if (parsed.contains("version")) {
        std::cout << "cassmig " << CASSMIG_VERSION << '\n';
        return Action{Action::Exit{EXIT_SUCCESS}};
    }

    if (parsed.contains("config-description")) {
        return Action{Action::ConfigDescription{.outputPath = parsed["config-description"].as<std::string>()}};
    }

    auto configPath = parsed["conf"].as<std::string>();

    if (parsed.contains("verify"))
        return Action{Action::VerifyConfig{.configPath = std::move(configPath)}};

    auto const command = parsed["migrate"].as<std::string>();
    if (command == "status")
        return Action{Action::Migrate{.configPath = std::move(configPath), .subCmd = MigrateSubCmd::status()}};
    if (command == "run")
        return Action{Action::Migrate{.configPath = std::move(configPath), .subCmd = MigrateSubCmd::run()}};

    std::cerr << "Unknown migration command '" << command << "'; expected run or status\n\n" << description;
    return Action{Action::Exit{EXIT_FAILURE}};
}

}  // namespace app
