/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <exception>
#include <iostream>
#include <clocale>

#include <unistd.h>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "libregauth/Error.hpp"
#include "libregauth/Logger.hpp"
#include "libregauth/utility/environment.hpp"
#include "cli/CommandAuthenticate.hpp"

using namespace regauth;

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8"); // enable handling of non-ascii characters

    auto& logger = libregauth::Logger::getInstance();

    try {
        auto installationPrefixDir = boost::filesystem::canonical("/proc/self/exe").parent_path().parent_path();
        auto configSchemaFile = installationPrefixDir / "etc/regauth.schema.json";
        auto hostEnvironment = libregauth::environment::parseVariables(environ);

        auto command = cli::CommandAuthenticate{argc, argv, configSchemaFile, std::move(hostEnvironment)};
        command.execute();
    }
    catch(const libregauth::Error& e) {
        logger.logErrorTrace(e, "main");
        return 1;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Caught exception in main function. No error trace available."
                                     " Exception message: %s") % e.what();
        logger.log(message.str(), "main", libregauth::LogLevel::ERROR);
        return 1;
    }

    return 0;
}
