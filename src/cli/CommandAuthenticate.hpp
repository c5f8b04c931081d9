/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandAuthenticate_hpp
#define cli_CommandAuthenticate_hpp

#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libregauth/Error.hpp"
#include "libregauth/Logger.hpp"
#include "libregauth/utility/process.hpp"
#include "registry/Client.hpp"
#include "registry/Config.hpp"
#include "registry/CpprestTransport.hpp"


namespace regauth {
namespace cli {

class CommandAuthenticate {
public:
    CommandAuthenticate(int argc, char* argv[],
                        const boost::filesystem::path& configSchemaFile,
                        std::unordered_map<std::string, std::string> hostEnvironment)
        : conf{std::make_shared<registry::Config>()}
        , configSchemaFile{configSchemaFile}
        , hostEnvironment{std::move(hostEnvironment)}
    {
        initializeOptionsDescription();
        parseCommandArguments(argc, argv);
    }

    void execute() {
        if(isHelpRequested) {
            printHelpMessage();
            return;
        }

        auto transport = std::make_shared<registry::CpprestTransport>(conf);
        auto client = registry::Client{conf, transport};

        auto authenticatedClient = client.authenticate(scopes).get();
        std::cout << "credential: " << authenticatedClient.getCredential()->describe() << std::endl;

        auto isAuthenticated = authenticatedClient.isAuthenticated().get();
        std::cout << "authenticated: " << (isAuthenticated ? "true" : "false") << std::endl;
    }

    void printHelpMessage() const {
        std::cout << "Usage: regauth [OPTIONS] REGISTRY" << std::endl << std::endl
                  << "Negotiate authentication with a container registry" << std::endl << std::endl
                  << visibleOptionsDescription << std::endl;
    }

private:
    void initializeOptionsDescription() {
        visibleOptionsDescription.add_options()
            ("help", "Print help")
            ("debug", "Enable debug mode (print all log messages with DEBUG level or higher)")
            ("verbose", "Enable verbose mode (print all log messages with INFO level or higher)")
            ("config",
                boost::program_options::value<std::string>(&configFile),
                "Read the registry settings from the given JSON file")
            ("insecure", "Connect to the registry over plain HTTP")
            ("login", "Enter user credentials for the registry from stdin. "
                      "Cannot be used in conjunction with '--password-stdin'")
            ("password-stdin", "Read password for the registry from stdin. "
                      "Cannot be used in conjunction with '--login'")
            ("username,u",
                boost::program_options::value<std::string>(&username),
                "Username for the registry")
            ("scope",
                boost::program_options::value<std::vector<std::string>>(&scopes),
                "Scope requested to the token endpoint, e.g. repository:library/alpine:pull (repeatable)");
        hiddenOptionsDescription.add_options()
            ("registry", boost::program_options::value<std::string>(&registryServer));
        allOptionsDescription.add(visibleOptionsDescription).add(hiddenOptionsDescription);
        positionalOptionsDescription.add("registry", 1);
    }

    void parseCommandArguments(int argc, char* argv[]) {
        auto values = boost::program_options::variables_map{};

        try {
            boost::program_options::store(
                boost::program_options::command_line_parser(argc, argv)
                        .options(allOptionsDescription)
                        .positional(positionalOptionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run(), values);
            boost::program_options::notify(values);
        }
        catch (const std::exception& e) {
            auto message = boost::format("%s\nSee 'regauth --help'") % e.what();
            printLog(message, libregauth::LogLevel::GENERAL, std::cerr);
            REGAUTH_THROW_ERROR(message.str(), libregauth::LogLevel::INFO);
        }

        configureLogger(values);
        printLog(boost::format("parsing CLI arguments"), libregauth::LogLevel::DEBUG);

        if(values.count("help")) {
            isHelpRequested = true;
            return;
        }

        if(values.count("config")) {
            *conf = registry::Config{configFile, configSchemaFile};
        }
        conf->transport.hostEnvironment = hostEnvironment;

        if(values.count("registry")) {
            conf->registry.server = registryServer;
        }
        if(conf->registry.server.empty()) {
            auto message = boost::format("No registry specified\nSee 'regauth --help'");
            printLog(message, libregauth::LogLevel::GENERAL, std::cerr);
            REGAUTH_THROW_ERROR(message.str(), libregauth::LogLevel::INFO);
        }

        if(values.count("insecure")) {
            conf->registry.insecure = true;
        }

        if(values.count("username")) {
            conf->authentication.isAuthenticationNeeded = true;
            validateUsername(username);
            conf->authentication.username = username;
        }

        if(values.count("password-stdin")) {
            if(values.count("login")) {
                REGAUTH_THROW_ERROR("The options '--password-stdin' and '--login' cannot be used together");
            }
            conf->authentication.isAuthenticationNeeded = true;
            conf->authentication.password = readPasswordFromStdin();
        }

        if(values.count("login")) {
            conf->authentication.isAuthenticationNeeded = true;
            readUserCredentialsFromCLI(conf->authentication);
        }

        printLog(boost::format("successfully parsed CLI arguments"), libregauth::LogLevel::DEBUG);
    }

    void configureLogger(const boost::program_options::variables_map& values) const {
        auto& logger = libregauth::Logger::getInstance();
        if(values.count("debug")) {
            logger.setLevel(libregauth::LogLevel::DEBUG);
        }
        else if(values.count("verbose")) {
            logger.setLevel(libregauth::LogLevel::INFO);
        }
        else {
            logger.setLevel(libregauth::LogLevel::WARN);
        }
    }

    /**
     * Get the username/password from user input, and store into config.
     */
    void readUserCredentialsFromCLI(registry::Config::Authentication& authentication) {
        printLog(boost::format("reading user credentials from CLI"), libregauth::LogLevel::DEBUG);

        std::cout << "username: ";
        if (username.empty()) {
            std::getline(std::cin, username);

            validateUsername(username);
            authentication.username = username;
        }
        else {
            std::cout << username << std::endl;
        }

        std::cout << "password: ";
        authentication.password = readPasswordFromStdin();
        std::cout << std::endl;

        printLog(boost::format("successfully read user credentials"), libregauth::LogLevel::DEBUG);
    }

    void validateUsername(const std::string& username) const {
        if (username.empty()) {
            REGAUTH_THROW_ERROR("Invalid username: empty value provided");
        }
    }

    std::string readPasswordFromStdin() const {
        auto password = std::string{};

        libregauth::process::setStdinEcho(false);
        std::getline(std::cin, password);
        libregauth::process::setStdinEcho(true);

        if(password.empty()) {
            REGAUTH_THROW_ERROR("Failed to read password from stdin: empty value provided");
        }

        return password;
    }

    void printLog(const boost::format& message, libregauth::LogLevel level,
                  std::ostream& outStream = std::cout) const {
        libregauth::Logger::getInstance().log(message, "CLI", level, outStream, std::cerr);
    }

private:
    boost::program_options::options_description allOptionsDescription{};
    boost::program_options::options_description visibleOptionsDescription{"Options"};
    boost::program_options::options_description hiddenOptionsDescription{};
    boost::program_options::positional_options_description positionalOptionsDescription{};
    std::shared_ptr<registry::Config> conf;
    boost::filesystem::path configSchemaFile;
    std::unordered_map<std::string, std::string> hostEnvironment;
    std::string configFile;
    std::string registryServer;
    std::string username;
    std::vector<std::string> scopes;
    bool isHelpRequested = false;
};

}
}

#endif
